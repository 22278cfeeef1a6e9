#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace scales {

// One test case. Input is the comma-separated list of JSON-encoded
// arguments, Expected a JSON value (or a raw string when not JSON).
struct TestCase {
  std::string input;
  std::string expected;

  auto operator==(const TestCase&) const -> bool = default;
};

struct Problem {
  std::string id;
  std::string title;
  std::vector<TestCase> test_cases;
  std::map<std::string, std::string> starter_code;  // language -> code
  std::map<std::string, std::string> solutions;     // language -> code
};

// GTest printer for readable parameter names
inline void PrintTo(const TestCase& test_case, std::ostream* os) {
  *os << "{" << test_case.input << " -> " << test_case.expected << "}";
}

}  // namespace scales
