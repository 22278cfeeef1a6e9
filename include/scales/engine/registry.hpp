#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "scales/common/error.hpp"
#include "scales/common/subprocess.hpp"
#include "scales/config/config.hpp"
#include "scales/engine/runner.hpp"
#include "scales/engine/test_result.hpp"
#include "scales/problem/problem.hpp"

namespace scales {

// Map common aliases onto canonical language ids: py -> python,
// js/node -> javascript, golang -> go. Case-insensitive; unknown names are
// returned lower-cased.
auto NormalizeLanguage(std::string_view language) -> std::string;

// Language id -> runner lookup. Safe for concurrent lookups; registration
// takes an exclusive lock.
class RunnerRegistry {
 public:
  RunnerRegistry() = default;

  // Exact match on the id the runner reported; aliases are not resolved.
  [[nodiscard]] auto GetRunner(std::string_view language) const
      -> Result<std::shared_ptr<const Runner>>;

  // Replaces any runner registered for the same language.
  auto RegisterRunner(std::shared_ptr<const Runner> runner) -> Result<void>;

  // Sorted ascending.
  [[nodiscard]] auto GetSupportedLanguages() const -> std::vector<std::string>;

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, std::shared_ptr<const Runner>, std::less<>> runners_;
};

// Registry with the built-in python, javascript and go runners, configured
// from `config`. A null executor selects PosixProcessExecutor.
auto MakeDefaultRegistry(
    const config::EngineConfig& config,
    std::shared_ptr<common::ProcessExecutor> executor = nullptr)
    -> std::unique_ptr<RunnerRegistry>;

// Look up the runner for `language` (aliases resolved through
// NormalizeLanguage) and execute. An unknown language yields
// N default results together with a kUnknownLanguage error.
auto ExecuteTests(
    const RunnerRegistry& registry, const Problem& problem,
    std::string_view code, std::string_view language,
    std::chrono::milliseconds timeout, std::stop_token stop_token = {})
    -> ExecutionOutcome;

}  // namespace scales
