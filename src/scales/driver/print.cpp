#include "print.hpp"

#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "scales/common/error.hpp"
#include "scales/engine/test_result.hpp"

namespace scales::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;
constexpr auto kPassStyle =
    fmt::fg(fmt::terminal_color::bright_green) | fmt::emphasis::bold;
constexpr auto kFailStyle =
    fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;

}  // namespace

void PrintError(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("scales", kToolStyle),
      fmt::styled("error:", kFailStyle),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintWarning(const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("scales", kToolStyle),
      fmt::styled(
          "warning:",
          fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold),
      fmt::styled(message, fmt::emphasis::bold));
}

void PrintError(const Error& error) {
  PrintError(error.message);
  for (const auto& note : error.notes) {
    fmt::print(
        stderr, "{}: {} {}\n", fmt::styled("scales", kToolStyle),
        fmt::styled(
            "note:",
            fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold),
        note);
  }
}

void PrintOutcome(const std::string& label, const ExecutionOutcome& outcome) {
  for (size_t i = 0; i < outcome.results.size(); ++i) {
    const auto& result = outcome.results[i];
    if (result.passed) {
      fmt::print("Test {}: {}\n", i + 1, fmt::styled("PASSED", kPassStyle));
      continue;
    }
    fmt::print("Test {}: {}\n", i + 1, fmt::styled("FAILED", kFailStyle));
    fmt::print("  input:    {}\n", result.input);
    fmt::print("  expected: {}\n", result.expected);
    fmt::print("  actual:   {}\n", result.actual);
  }

  auto passed = CountPassed(outcome.results);
  fmt::print(
      "{}: {}/{} test{} passed\n", label, passed, outcome.results.size(),
      outcome.results.size() == 1 ? "" : "s");
  if (outcome.error) {
    PrintError(*outcome.error);
  }
}

auto ExitCodeFor(const ExecutionOutcome& outcome) -> int {
  if (outcome.error) {
    return 2;
  }
  return outcome.all_passed ? 0 : 1;
}

}  // namespace scales::driver
