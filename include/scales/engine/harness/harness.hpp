#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "scales/common/error.hpp"
#include "scales/problem/problem.hpp"

namespace scales::harness {

// Produces the self-contained source that drives a solution through a
// problem's test cases. Implementations are stateless; Generate is a pure
// function of its inputs.
//
// The generated program must, for each test case n (1-based, in order):
//   print "Test <n>",
//   decode "[" + input + "]" as the JSON argument list and call the entry
//   point, then print "✅ PASSED", or "❌ FAILED" followed by
//   "Expected: <e>" and "Got: <a>" lines,
// and exit non-zero when any test failed.
class HarnessGenerator {
 public:
  HarnessGenerator() = default;
  virtual ~HarnessGenerator() = default;

  HarnessGenerator(const HarnessGenerator&) = delete;
  auto operator=(const HarnessGenerator&) -> HarnessGenerator& = delete;
  HarnessGenerator(HarnessGenerator&&) = delete;
  auto operator=(HarnessGenerator&&) -> HarnessGenerator& = delete;

  [[nodiscard]] virtual auto Language() const -> std::string = 0;

  // File name of the harness inside the working directory.
  [[nodiscard]] virtual auto SourceFileName() const -> std::string = 0;

  // Toolchain invocation; "{file}" is replaced with the harness path.
  [[nodiscard]] virtual auto DefaultCommand() const
      -> std::vector<std::string> = 0;

  // First function declared in `code`, or "" when there is none.
  [[nodiscard]] virtual auto FunctionName(std::string_view code) const
      -> std::string = 0;

  [[nodiscard]] virtual auto Generate(
      const Problem& problem, std::string_view code,
      std::string_view entry_point) const -> Result<std::string> = 0;
};

// Returns the first non-empty capture group of the first match.
auto FirstCapture(const std::regex& pattern, std::string_view code)
    -> std::string;

// Entry points are spliced into generated code, so they must be plain
// identifiers ("$" is allowed for JavaScript).
auto ValidateEntryPoint(std::string_view entry_point, bool allow_dollar)
    -> Result<void>;

}  // namespace scales::harness
