#include "scales/engine/harness/javascript.hpp"

#include <cctype>
#include <cstddef>
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

constexpr std::string_view kPrologue = "// User's solution\n";

// Placeholder @ENTRY@ is the entry point name. Braces in JavaScript make
// std::format templates unreadable, so substitution is textual here.
constexpr std::string_view kDriver = R"(

function __scalesEntry() {
  if (typeof @ENTRY@ === "function") {
    return @ENTRY@;
  }
  if (typeof Solution === "function") {
    const instance = new Solution();
    if (typeof instance.@ENTRY@ === "function") {
      return instance.@ENTRY@.bind(instance);
    }
    if (typeof Solution.@ENTRY@ === "function") {
      return Solution.@ENTRY@.bind(Solution);
    }
  }
  throw new ReferenceError("entry point '@ENTRY@' is not defined");
}

function __scalesCanonical(value) {
  if (value === undefined) {
    return "null";
  }
  if (value instanceof Set) {
    return __scalesCanonical(Array.from(value));
  }
  if (value instanceof Map) {
    return __scalesCanonical(Object.fromEntries(value));
  }
  if (Array.isArray(value)) {
    return "[" + value.map(__scalesCanonical).join(",") + "]";
  }
  if (value !== null && typeof value === "object") {
    return "{" + Object.keys(value).sort().map(
        (key) => JSON.stringify(key) + ":" + __scalesCanonical(value[key]))
        .join(",") + "}";
  }
  const text = JSON.stringify(value);
  return text === undefined ? "null" : text;
}

function __scalesLine(text) {
  process.stdout.write(String(text).replace(/\r?\n|\r/g, " ") + "\n");
}

function __scalesMatches(actual, result, expectedText) {
  let expected;
  try {
    expected = JSON.parse(expectedText);
  } catch (e) {
    return actual === expectedText || String(result) === expectedText;
  }
  return actual === __scalesCanonical(expected);
}

async function __scalesRunCase(index, inputText, expectedText) {
  __scalesLine("Test " + index);
  let actual;
  let passed;
  try {
    const args = JSON.parse("[" + inputText + "]");
    const result = await __scalesEntry()(...args);
    actual = __scalesCanonical(result);
    passed = __scalesMatches(actual, result, expectedText);
  } catch (e) {
    const name = e && e.name ? e.name : "Error";
    const message = e && e.message !== undefined ? e.message : String(e);
    actual = "Error: " + name + ": " + message;
    passed = false;
  }
  if (passed) {
    __scalesLine("✅ PASSED");
  } else {
    __scalesLine("❌ FAILED");
    __scalesLine("Expected: " + expectedText);
    __scalesLine("Got: " + actual);
  }
  return passed;
}

async function __scalesMain() {
  let allPassed = true;
)";

constexpr std::string_view kEpilogue = R"(  return allPassed;
}

__scalesMain().then(
    (allPassed) => {
      if (!allPassed) {
        process.exitCode = 1;
      }
    },
    (error) => {
      process.stderr.write(String(error && error.stack ? error.stack : error) + "\n");
      process.exitCode = 1;
    });
)";

// First method declared directly in the body of `class Solution`, skipping
// the constructor. Braces in string literals are not accounted for.
auto SolutionMethodName(std::string_view code) -> std::string {
  static const std::regex kClass(R"(class\s+Solution\b[^{]*\{)");
  static const std::regex kMember(
      R"((?:static\s+)?(?:async\s+)?([A-Za-z_$][\w$]*)\s*\()");

  std::match_results<std::string_view::const_iterator> header;
  if (!std::regex_search(code.begin(), code.end(), header, kClass)) {
    return "";
  }

  int depth = 1;
  bool member_start = true;
  auto body = static_cast<size_t>(header.position(0) + header.length(0));
  for (size_t pos = body; pos < code.size() && depth > 0; ++pos) {
    char c = code[pos];
    if (depth == 1 && member_start &&
        std::isspace(static_cast<unsigned char>(c)) == 0) {
      member_start = false;
      std::match_results<std::string_view::const_iterator> member;
      if (std::regex_search(
              code.begin() + static_cast<std::ptrdiff_t>(pos), code.end(),
              member, kMember, std::regex_constants::match_continuous) &&
          member[1].str() != "constructor") {
        return member[1].str();
      }
    }
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      --depth;
      member_start = depth == 1;
    } else if (c == ';') {
      member_start = depth == 1;
    }
  }
  return "";
}

}  // namespace

auto JavaScriptHarness::Language() const -> std::string {
  return "javascript";
}

auto JavaScriptHarness::SourceFileName() const -> std::string {
  return "test_solution.js";
}

auto JavaScriptHarness::DefaultCommand() const -> std::vector<std::string> {
  return {"node", "{file}"};
}

auto JavaScriptHarness::FunctionName(std::string_view code) const
    -> std::string {
  // Function declarations and arrow functions bound to const
  static const std::regex kPattern(
      R"(function\s+([a-zA-Z0-9_$]+)\s*\(|const\s+([a-zA-Z0-9_$]+)\s*=\s*\(?.*\)?\s*=>)");
  auto name = FirstCapture(kPattern, code);
  if (name.empty()) {
    name = SolutionMethodName(code);
  }
  return name;
}

auto JavaScriptHarness::Generate(
    const Problem& problem, std::string_view code,
    std::string_view entry_point) const -> Result<std::string> {
  if (auto valid = ValidateEntryPoint(entry_point, true); !valid) {
    return std::unexpected(std::move(valid.error()));
  }

  std::string source(kPrologue);
  source += code;
  source += common::ReplaceAll(std::string(kDriver), "@ENTRY@", entry_point);

  for (size_t i = 0; i < problem.test_cases.size(); ++i) {
    const auto& test_case = problem.test_cases[i];
    source += std::format(
        "  // Test case {0}\n"
        "  if (!(await __scalesRunCase({0}, {1}, {2}))) {{\n"
        "    allPassed = false;\n"
        "  }}\n",
        i + 1, common::QuoteLiteral(test_case.input),
        common::QuoteLiteral(test_case.expected));
  }
  source += kEpilogue;
  return source;
}

}  // namespace scales::harness
