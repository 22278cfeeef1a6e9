#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace scales::log {

// Shared engine logger ("scales"), writing to stderr so that stdout stays
// reserved for command output. Created on first use.
auto Logger() -> std::shared_ptr<spdlog::logger>;

// 0 = warnings only, 1 = info, 2+ = debug. SCALES_LOG_LEVEL, when set to a
// spdlog level name, takes precedence.
void SetVerbosity(int level);

// Structured record of an execution that failed or had failing tests.
struct ExecutionEvent {
  std::string kind;  // ErrorKind name, or "test_failures"
  std::string problem_id;
  std::string language;
  size_t tests = 0;
  size_t failed = 0;
  std::string detail;
};

// Emit one machine-readable event line: error level for engine failures,
// info level for runs that merely had failing tests.
void LogExecutionEvent(const ExecutionEvent& event);

}  // namespace scales::log
