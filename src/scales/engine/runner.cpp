#include "scales/engine/runner.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/ranges.h>

#include "scales/common/error.hpp"
#include "scales/common/internal_error.hpp"
#include "scales/common/string_utils.hpp"
#include "scales/common/subprocess.hpp"
#include "scales/common/temp_directory.hpp"
#include "scales/engine/harness/harness.hpp"
#include "scales/engine/output_protocol.hpp"
#include "scales/engine/test_result.hpp"
#include "scales/log/logger.hpp"
#include "scales/problem/problem.hpp"

namespace scales {

namespace {

auto DefaultResults(const Problem& problem) -> std::vector<TestResult> {
  std::vector<TestResult> results;
  results.reserve(problem.test_cases.size());
  for (const auto& tc : problem.test_cases) {
    results.push_back(
        TestResult{.input = tc.input, .expected = tc.expected});
  }
  return results;
}

auto WriteHarness(const std::filesystem::path& path, std::string_view source)
    -> Result<void> {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return std::unexpected(
        Error::Setup(std::format("cannot create '{}'", path.string())));
  }
  out.write(source.data(), static_cast<std::streamsize>(source.size()));
  out.close();
  if (!out) {
    return std::unexpected(
        Error::Setup(std::format("cannot write '{}'", path.string())));
  }
  return {};
}

auto FirstLine(std::string_view text) -> std::string_view {
  text = common::Trim(text);
  auto pos = text.find('\n');
  return pos == std::string_view::npos ? text : text.substr(0, pos);
}

void ReportOutcome(
    const Problem& problem, std::string_view language,
    const ExecutionOutcome& outcome) {
  size_t failed = outcome.results.size() - CountPassed(outcome.results);
  if (outcome.error) {
    log::LogExecutionEvent(
        log::ExecutionEvent{
            .kind = ToString(outcome.error->kind),
            .problem_id = problem.id,
            .language = std::string(language),
            .tests = outcome.results.size(),
            .failed = failed,
            .detail = outcome.error->Format(),
        });
  } else if (failed > 0) {
    log::LogExecutionEvent(
        log::ExecutionEvent{
            .kind = "test_failures",
            .problem_id = problem.id,
            .language = std::string(language),
            .tests = outcome.results.size(),
            .failed = failed,
        });
  }
}

}  // namespace

HarnessRunner::HarnessRunner(
    std::unique_ptr<harness::HarnessGenerator> generator,
    std::shared_ptr<common::ProcessExecutor> executor, RunnerOptions options)
    : generator_(std::move(generator)),
      executor_(std::move(executor)),
      options_(std::move(options)) {
  if (generator_ == nullptr || executor_ == nullptr) {
    common::ThrowInternalError(
        "HarnessRunner", "a generator and an executor are required");
  }
  if (options_.command.empty()) {
    options_.command = generator_->DefaultCommand();
  }
}

auto HarnessRunner::Language() const -> std::string {
  return generator_->Language();
}

auto HarnessRunner::FunctionName(std::string_view code) const -> std::string {
  return generator_->FunctionName(code);
}

auto HarnessRunner::GenerateTestCode(
    const Problem& problem, std::string_view code) const
    -> Result<std::string> {
  auto entry = generator_->FunctionName(code);
  if (entry.empty()) {
    entry = options_.default_function;
  }
  return generator_->Generate(problem, code, entry);
}

auto HarnessRunner::BuildCommand(
    const std::filesystem::path& harness_file,
    const std::filesystem::path& work_dir) const -> std::vector<std::string> {
  std::vector<std::string> argv;
  argv.reserve(options_.command.size() + 1);
  bool has_file = false;
  for (const auto& arg : options_.command) {
    if (arg.find("{file}") != std::string::npos) {
      has_file = true;
    }
    auto expanded = common::ReplaceAll(arg, "{file}", harness_file.string());
    argv.push_back(common::ReplaceAll(
        std::move(expanded), "{dir}", work_dir.string()));
  }
  if (!has_file) {
    argv.push_back(harness_file.string());
  }
  return argv;
}

auto HarnessRunner::ExecuteTests(
    const Problem& problem, std::string_view code,
    std::chrono::milliseconds timeout, std::stop_token stop_token) const
    -> ExecutionOutcome {
  auto language = Language();
  ExecutionOutcome outcome{.results = DefaultResults(problem)};
  log::Logger()->info(
      "executing {} test(s) for problem '{}' in {}", problem.test_cases.size(),
      problem.id, language);

  auto fail = [&](Error error) -> ExecutionOutcome {
    outcome.all_passed = false;
    outcome.error = std::move(error);
    ReportOutcome(problem, language, outcome);
    return std::move(outcome);
  };

  auto work_dir = common::ScopedTempDirectory::Create(
      options_.temp_root, std::format("scales-{}-", language),
      options_.keep_temp);
  if (!work_dir) {
    return fail(std::move(work_dir.error()));
  }
  if (options_.keep_temp) {
    log::Logger()->info("keeping work directory {}", work_dir->Path().string());
  }

  auto source = GenerateTestCode(problem, code);
  if (!source) {
    return fail(std::move(source.error()));
  }

  auto harness_file = work_dir->Path() / generator_->SourceFileName();
  if (auto written = WriteHarness(harness_file, *source); !written) {
    return fail(std::move(written.error()));
  }

  log::Logger()->debug("wrote harness {}", harness_file.string());

  auto argv = BuildCommand(harness_file, work_dir->Path());
  log::Logger()->debug("running: {}", fmt::join(argv, " "));

  auto run = executor_->Run(
      argv, common::ProcessOptions{
                .timeout = timeout,
                .working_dir = work_dir->Path(),
                .max_output_bytes = options_.max_output_bytes,
                .stop_token = stop_token,
            });
  if (!run) {
    return fail(
        std::move(run.error())
            .WithNote(fmt::format("command: {}", fmt::join(argv, " "))));
  }

  log::Logger()->debug(
      "{} finished: {} (exit code {}) in {}ms", language,
      common::ToString(run->termination), run->exit_code,
      run->elapsed.count());

  outcome.results = ParseTestOutput(run->stdout_text, problem.test_cases);
  log::Logger()->info(
      "{}/{} test(s) passed in {}ms", CountPassed(outcome.results),
      outcome.results.size(), run->elapsed.count());

  if (!run->Success() && !common::Trim(run->stderr_text).empty()) {
    log::Logger()->warn(
        "{} process reported errors: {}", language,
        FirstLine(run->stderr_text));
    AttributeError(outcome.results, run->stderr_text);
  }
  if (run->truncated) {
    log::Logger()->warn(
        "{} output exceeded {} bytes and was truncated", language,
        options_.max_output_bytes);
  }

  switch (run->termination) {
    case common::Termination::kTimedOut:
      return fail(Error::Timeout(
          std::format("test execution timed out after {}", timeout)));
    case common::Termination::kCancelled:
      return fail(Error::Cancelled("test execution was cancelled"));
    case common::Termination::kExited:
    case common::Termination::kSignaled:
      break;
  }

  outcome.all_passed = AllTestsPassed(outcome.results);
  ReportOutcome(problem, language, outcome);
  return outcome;
}

}  // namespace scales
