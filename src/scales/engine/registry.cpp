#include "scales/engine/registry.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "scales/common/error.hpp"
#include "scales/common/subprocess.hpp"
#include "scales/config/config.hpp"
#include "scales/engine/harness/go.hpp"
#include "scales/engine/harness/harness.hpp"
#include "scales/engine/harness/javascript.hpp"
#include "scales/engine/harness/python.hpp"
#include "scales/engine/runner.hpp"
#include "scales/engine/test_result.hpp"
#include "scales/log/logger.hpp"
#include "scales/problem/problem.hpp"

namespace scales {

auto NormalizeLanguage(std::string_view language) -> std::string {
  std::string lower(language);
  std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "py" || lower == "python3") {
    return "python";
  }
  if (lower == "js" || lower == "node" || lower == "nodejs") {
    return "javascript";
  }
  if (lower == "golang") {
    return "go";
  }
  return lower;
}

auto RunnerRegistry::GetRunner(std::string_view language) const
    -> Result<std::shared_ptr<const Runner>> {
  std::shared_lock lock(mutex_);
  auto it = runners_.find(language);
  if (it == runners_.end()) {
    return std::unexpected(Error::UnknownLanguage(
        std::format("no test runner available for language: {}", language)));
  }
  return it->second;
}

auto RunnerRegistry::RegisterRunner(std::shared_ptr<const Runner> runner)
    -> Result<void> {
  if (runner == nullptr) {
    return std::unexpected(
        Error::InvalidArgument("test runner must not be null"));
  }
  auto language = runner->Language();
  if (language.empty()) {
    return std::unexpected(
        Error::InvalidArgument("test runner must specify a language"));
  }
  std::unique_lock lock(mutex_);
  runners_.insert_or_assign(std::move(language), std::move(runner));
  return {};
}

auto RunnerRegistry::GetSupportedLanguages() const
    -> std::vector<std::string> {
  std::shared_lock lock(mutex_);
  std::vector<std::string> languages;
  languages.reserve(runners_.size());
  for (const auto& [language, runner] : runners_) {
    languages.push_back(language);
  }
  return languages;
}

auto MakeDefaultRegistry(
    const config::EngineConfig& config,
    std::shared_ptr<common::ProcessExecutor> executor)
    -> std::unique_ptr<RunnerRegistry> {
  if (executor == nullptr) {
    executor = std::make_shared<common::PosixProcessExecutor>();
  }

  std::vector<std::unique_ptr<harness::HarnessGenerator>> generators;
  generators.push_back(std::make_unique<harness::PythonHarness>());
  generators.push_back(std::make_unique<harness::JavaScriptHarness>());
  generators.push_back(std::make_unique<harness::GoHarness>());

  std::map<std::string, std::vector<std::string>> commands;
  for (const auto& [language, command] : config.commands) {
    commands.insert_or_assign(NormalizeLanguage(language), command);
  }

  auto registry = std::make_unique<RunnerRegistry>();
  for (auto& generator : generators) {
    RunnerOptions options{
        .default_function = config.default_function,
        .max_output_bytes = config.max_output_bytes,
        .keep_temp = config.keep_temp,
    };
    if (auto it = commands.find(generator->Language());
        it != commands.end()) {
      options.command = it->second;
    }
    auto runner = std::make_shared<HarnessRunner>(
        std::move(generator), executor, std::move(options));
    if (auto registered = registry->RegisterRunner(std::move(runner));
        !registered) {
      throw ErrorException(std::move(registered.error()));
    }
  }

  for (const auto& [language, command] : commands) {
    if (!registry->GetRunner(language)) {
      log::Logger()->warn(
          "ignoring command for unsupported language '{}'", language);
    }
  }
  return registry;
}

auto ExecuteTests(
    const RunnerRegistry& registry, const Problem& problem,
    std::string_view code, std::string_view language,
    std::chrono::milliseconds timeout, std::stop_token stop_token)
    -> ExecutionOutcome {
  auto runner = registry.GetRunner(NormalizeLanguage(language));
  if (!runner) {
    ExecutionOutcome outcome;
    outcome.results.reserve(problem.test_cases.size());
    for (const auto& tc : problem.test_cases) {
      outcome.results.push_back(
          TestResult{.input = tc.input, .expected = tc.expected});
    }
    outcome.error = std::move(runner.error());
    log::LogExecutionEvent(
        log::ExecutionEvent{
            .kind = ToString(outcome.error->kind),
            .problem_id = problem.id,
            .language = std::string(language),
            .tests = outcome.results.size(),
            .failed = outcome.results.size(),
            .detail = outcome.error->Format(),
        });
    return outcome;
  }
  return (*runner)->ExecuteTests(
      problem, code, timeout, std::move(stop_token));
}

}  // namespace scales
