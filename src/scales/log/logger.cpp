#include "scales/log/logger.hpp"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "scales/common/string_utils.hpp"

namespace scales::log {

namespace {

constexpr const char* kLoggerName = "scales";

auto EscapeDetail(const std::string& detail) -> std::string {
  auto escaped = common::ReplaceAll(detail, "\\", "\\\\");
  escaped = common::ReplaceAll(escaped, "\"", "\\\"");
  return common::ReplaceAll(escaped, "\n", "\\n");
}

}  // namespace

auto Logger() -> std::shared_ptr<spdlog::logger> {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> logger;
  std::call_once(once, [] {
    logger = spdlog::get(kLoggerName);
    if (!logger) {
      logger = spdlog::stderr_color_mt(kLoggerName);
    }
    logger->set_pattern("[scales][%H:%M:%S][%^%l%$] %v");
    logger->set_level(spdlog::level::warn);
    if (const char* env = std::getenv("SCALES_LOG_LEVEL")) {
      logger->set_level(spdlog::level::from_str(env));
    }
  });
  return logger;
}

void SetVerbosity(int level) {
  if (std::getenv("SCALES_LOG_LEVEL") != nullptr) {
    return;
  }
  auto logger = Logger();
  if (level >= 2) {
    logger->set_level(spdlog::level::debug);
  } else if (level == 1) {
    logger->set_level(spdlog::level::info);
  } else {
    logger->set_level(spdlog::level::warn);
  }
}

void LogExecutionEvent(const ExecutionEvent& event) {
  auto level = event.kind == "test_failures" ? spdlog::level::info
                                             : spdlog::level::err;
  Logger()->log(
      level,
      "event={} problem={} language={} tests={} failed={} detail=\"{}\"",
      event.kind, event.problem_id, event.language, event.tests,
      event.failed, EscapeDetail(event.detail));
}

}  // namespace scales::log
