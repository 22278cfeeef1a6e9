#include "scales/engine/harness/python.hpp"

#include <expected>
#include <format>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "scales/common/error.hpp"
#include "scales/common/string_utils.hpp"
#include "scales/engine/harness/harness.hpp"
#include "scales/problem/problem.hpp"

namespace scales::harness {

namespace {

constexpr std::string_view kPrologue = R"(import json as _scales_json
import sys as _scales_sys

if hasattr(_scales_sys.stdout, "reconfigure"):
    _scales_sys.stdout.reconfigure(encoding="utf-8")

# User's solution
)";

// {0} is the entry point name.
constexpr std::string_view kDriver = R"(

def _scales_entry():
    fn = globals().get("{0}")
    if fn is None and "Solution" in globals():
        fn = getattr(globals()["Solution"](), "{0}", None)
    if fn is None:
        raise NameError("entry point '{0}' is not defined")
    return fn


def _scales_encode(value):
    return _scales_json.dumps(
        value, sort_keys=True, separators=(",", ":"), default=str)


def _scales_line(text):
    print(str(text).replace("\r", " ").replace("\n", " "), flush=True)


def _scales_matches(actual, result, expected_text):
    try:
        expected = _scales_json.loads(expected_text)
    except ValueError:
        return actual == expected_text or str(result) == expected_text
    return _scales_json.loads(actual) == expected


def _scales_run_case(index, input_text, expected_text):
    print("Test %d" % index, flush=True)
    try:
        args = _scales_json.loads("[" + input_text + "]")
        result = _scales_entry()(*args)
        actual = _scales_encode(result)
        passed = _scales_matches(actual, result, expected_text)
    except Exception as e:
        actual = "Error: %s: %s" % (type(e).__name__, e)
        passed = False
    if passed:
        _scales_line("✅ PASSED")
    else:
        _scales_line("❌ FAILED")
        _scales_line("Expected: " + expected_text)
        _scales_line("Got: " + actual)
    return passed


def _scales_main():
    all_passed = True
)";

constexpr std::string_view kEpilogue = R"(    return all_passed


if __name__ == "__main__":
    if not _scales_main():
        _scales_sys.exit(1)
)";

}  // namespace

auto PythonHarness::Language() const -> std::string {
  return "python";
}

auto PythonHarness::SourceFileName() const -> std::string {
  return "test_solution.py";
}

auto PythonHarness::DefaultCommand() const -> std::vector<std::string> {
  return {"python3", "-u", "{file}"};
}

auto PythonHarness::FunctionName(std::string_view code) const -> std::string {
  static const std::regex kPattern(R"(def\s+([a-zA-Z0-9_]+)\s*\()");
  return FirstCapture(kPattern, code);
}

auto PythonHarness::Generate(
    const Problem& problem, std::string_view code,
    std::string_view entry_point) const -> Result<std::string> {
  if (auto valid = ValidateEntryPoint(entry_point, false); !valid) {
    return std::unexpected(std::move(valid.error()));
  }

  std::string source(kPrologue);
  source += code;
  source += std::vformat(kDriver, std::make_format_args(entry_point));

  for (size_t i = 0; i < problem.test_cases.size(); ++i) {
    const auto& test_case = problem.test_cases[i];
    source += std::format(
        "    # Test case {0}\n"
        "    if not _scales_run_case({0}, {1}, {2}):\n"
        "        all_passed = False\n",
        i + 1, common::QuoteLiteral(test_case.input),
        common::QuoteLiteral(test_case.expected));
  }
  source += kEpilogue;
  return source;
}

}  // namespace scales::harness
