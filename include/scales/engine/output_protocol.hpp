#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "scales/engine/test_result.hpp"
#include "scales/problem/problem.hpp"

namespace scales {

// Marker lines exchanged between a generated harness and the host.
// Byte-for-byte compatible with existing problem data.
inline constexpr std::string_view kTestMarkerPrefix = "Test ";
inline constexpr std::string_view kPassedMarker = "✅ PASSED";
inline constexpr std::string_view kFailedMarker = "❌ FAILED";
inline constexpr std::string_view kGotPrefix = "Got: ";
inline constexpr std::string_view kExpectedPrefix = "Expected: ";

// Parse harness stdout into one result per test case. Lines that match no
// marker shape are ignored, so interleaved diagnostics are harmless.
auto ParseTestOutput(
    std::string_view output, const std::vector<TestCase>& test_cases)
    -> std::vector<TestResult>;

// Overwrite Actual of every still-failing result with "Error: <stderr>" so
// crashes and compile errors are distinguishable from clean FAILED markers.
void AttributeError(
    std::vector<TestResult>& results, std::string_view stderr_text);

}  // namespace scales
