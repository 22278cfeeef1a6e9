#include "scales/engine/output_protocol.hpp"

#include <charconv>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "scales/common/string_utils.hpp"
#include "scales/engine/test_result.hpp"
#include "scales/problem/problem.hpp"

namespace scales {

namespace {

// Parse the 1-based index of a "Test <n>" line. Leading blanks are skipped
// and anything after the number is ignored; returns 0 when there is none.
auto ParseTestIndex(std::string_view rest) -> size_t {
  while (!rest.empty() && (rest.front() == ' ' || rest.front() == '\t')) {
    rest.remove_prefix(1);
  }
  size_t index = 0;
  auto [ptr, ec] =
      std::from_chars(rest.data(), rest.data() + rest.size(), index);
  if (ec != std::errc{}) {
    return 0;
  }
  return index;
}

}  // namespace

auto ParseTestOutput(
    std::string_view output, const std::vector<TestCase>& test_cases)
    -> std::vector<TestResult> {
  std::vector<TestResult> results;
  results.reserve(test_cases.size());
  for (const auto& test_case : test_cases) {
    results.push_back(
        TestResult{
            .input = test_case.input,
            .expected = test_case.expected,
            .actual = std::string(kNoOutputCaptured),
            .passed = false,
        });
  }

  // No test is active until a valid "Test <n>" marker is seen
  std::ptrdiff_t current = -1;

  size_t pos = 0;
  while (pos <= output.size()) {
    size_t end = output.find('\n', pos);
    if (end == std::string_view::npos) {
      end = output.size();
    }
    std::string_view line = output.substr(pos, end - pos);
    pos = end + 1;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    if (line.starts_with(kTestMarkerPrefix)) {
      size_t index = ParseTestIndex(line.substr(kTestMarkerPrefix.size()));
      if (index >= 1 && index <= results.size()) {
        current = static_cast<std::ptrdiff_t>(index - 1);
      }
      continue;
    }

    if (current < 0) {
      continue;
    }
    auto& result = results[static_cast<size_t>(current)];

    if (line.find(kPassedMarker) != std::string_view::npos) {
      result.passed = true;
      result.actual = result.expected;
    } else if (line.find(kFailedMarker) != std::string_view::npos) {
      result.passed = false;
      if (auto got = line.find(kGotPrefix); got != std::string_view::npos) {
        result.actual =
            std::string(common::Trim(line.substr(got + kGotPrefix.size())));
      }
    } else if (line.starts_with(kGotPrefix)) {
      result.actual = std::string(line.substr(kGotPrefix.size()));
    }
  }

  return results;
}

void AttributeError(
    std::vector<TestResult>& results, std::string_view stderr_text) {
  if (stderr_text.empty()) {
    return;
  }
  std::string message = "Error: ";
  message += stderr_text;
  for (auto& result : results) {
    if (!result.passed) {
      result.actual = message;
    }
  }
}

auto AllTestsPassed(const std::vector<TestResult>& results) -> bool {
  for (const auto& result : results) {
    if (!result.passed) {
      return false;
    }
  }
  return true;
}

auto CountPassed(const std::vector<TestResult>& results) -> size_t {
  size_t passed = 0;
  for (const auto& result : results) {
    if (result.passed) {
      ++passed;
    }
  }
  return passed;
}

}  // namespace scales
