#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "scales/common/error.hpp"
#include "scales/engine/harness/harness.hpp"
#include "scales/problem/problem.hpp"

namespace scales::harness {

class PythonHarness final : public HarnessGenerator {
 public:
  [[nodiscard]] auto Language() const -> std::string override;
  [[nodiscard]] auto SourceFileName() const -> std::string override;
  [[nodiscard]] auto DefaultCommand() const
      -> std::vector<std::string> override;
  [[nodiscard]] auto FunctionName(std::string_view code) const
      -> std::string override;
  [[nodiscard]] auto Generate(
      const Problem& problem, std::string_view code,
      std::string_view entry_point) const -> Result<std::string> override;
};

}  // namespace scales::harness
