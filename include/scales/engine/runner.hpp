#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "scales/common/error.hpp"
#include "scales/common/subprocess.hpp"
#include "scales/engine/harness/harness.hpp"
#include "scales/engine/test_result.hpp"
#include "scales/problem/problem.hpp"

namespace scales {

// Language-specific test execution: harness generation, execution and
// result parsing behind one contract.
class Runner {
 public:
  Runner() = default;
  virtual ~Runner() = default;

  Runner(const Runner&) = delete;
  auto operator=(const Runner&) -> Runner& = delete;
  Runner(Runner&&) = delete;
  auto operator=(Runner&&) -> Runner& = delete;

  [[nodiscard]] virtual auto Language() const -> std::string = 0;

  // Entry point declared in `code`, or "" when none is found.
  [[nodiscard]] virtual auto FunctionName(std::string_view code) const
      -> std::string = 0;

  [[nodiscard]] virtual auto GenerateTestCode(
      const Problem& problem, std::string_view code) const
      -> Result<std::string> = 0;

  // Runs every test case of `problem` against `code`. Always returns one
  // result per test case; `error` distinguishes engine failures (setup,
  // toolchain, timeout, cancellation) from failing tests.
  [[nodiscard]] virtual auto ExecuteTests(
      const Problem& problem, std::string_view code,
      std::chrono::milliseconds timeout,
      std::stop_token stop_token = {}) const -> ExecutionOutcome = 0;
};

struct RunnerOptions {
  // Toolchain invocation template; empty selects the generator's default.
  // "{file}" is the harness path, "{dir}" the working directory. Without a
  // "{file}" argument the path is appended.
  std::vector<std::string> command;
  std::string default_function = "solution";
  size_t max_output_bytes = size_t{1} << 20;
  bool keep_temp = false;
  std::filesystem::path temp_root;  // System temp dir when empty
};

// The one generic Runner: a harness generator plus an invocation command,
// executed through an injected ProcessExecutor.
class HarnessRunner final : public Runner {
 public:
  HarnessRunner(
      std::unique_ptr<harness::HarnessGenerator> generator,
      std::shared_ptr<common::ProcessExecutor> executor,
      RunnerOptions options = {});

  [[nodiscard]] auto Language() const -> std::string override;
  [[nodiscard]] auto FunctionName(std::string_view code) const
      -> std::string override;
  [[nodiscard]] auto GenerateTestCode(
      const Problem& problem, std::string_view code) const
      -> Result<std::string> override;
  [[nodiscard]] auto ExecuteTests(
      const Problem& problem, std::string_view code,
      std::chrono::milliseconds timeout,
      std::stop_token stop_token = {}) const -> ExecutionOutcome override;

  [[nodiscard]] auto BuildCommand(
      const std::filesystem::path& harness_file,
      const std::filesystem::path& work_dir) const -> std::vector<std::string>;

 private:
  std::unique_ptr<harness::HarnessGenerator> generator_;
  std::shared_ptr<common::ProcessExecutor> executor_;
  RunnerOptions options_;
};

}  // namespace scales
