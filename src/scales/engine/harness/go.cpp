#include "scales/engine/harness/go.hpp"

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

// Harness imports are aliased so they cannot collide with the user's own
// imports, which follow directly and therefore stay ahead of any
// declaration as Go requires.
constexpr std::string_view kPrologue = R"(package main

import (
	scalesjson "encoding/json"
	scalesfmt "fmt"
	scalesos "os"
	scalesreflect "reflect"
	scalesstrings "strings"
)

// User's solution
)";

// Placeholder @ENTRY@ is the entry point name.
constexpr std::string_view kDriver = R"(

func scalesEncode(value interface{}) string {
	if v := scalesreflect.ValueOf(value); v.IsValid() && v.Kind() == scalesreflect.Slice && v.IsNil() {
		return "[]"
	}
	data, err := scalesjson.Marshal(value)
	if err != nil {
		return scalesfmt.Sprint(value)
	}
	return string(data)
}

func scalesLine(text string) {
	text = scalesstrings.ReplaceAll(text, "\r", " ")
	scalesfmt.Println(scalesstrings.ReplaceAll(text, "\n", " "))
}

func scalesCall(fn interface{}, inputText string) (actual string, err error) {
	defer func() {
		if r := recover(); r != nil {
			err = scalesfmt.Errorf("panic: %v", r)
		}
	}()
	fv := scalesreflect.ValueOf(fn)
	ft := fv.Type()
	var raw []scalesjson.RawMessage
	if e := scalesjson.Unmarshal([]byte("["+inputText+"]"), &raw); e != nil {
		return "", scalesfmt.Errorf("invalid input: %v", e)
	}
	if ft.IsVariadic() || len(raw) != ft.NumIn() {
		return "", scalesfmt.Errorf("expected %d arguments, got %d", ft.NumIn(), len(raw))
	}
	args := make([]scalesreflect.Value, len(raw))
	for i := range raw {
		arg := scalesreflect.New(ft.In(i))
		if e := scalesjson.Unmarshal(raw[i], arg.Interface()); e != nil {
			return "", scalesfmt.Errorf("argument %d: %v", i+1, e)
		}
		args[i] = arg.Elem()
	}
	outs := fv.Call(args)
	errorType := scalesreflect.TypeOf((*error)(nil)).Elem()
	if n := len(outs); n > 0 && ft.Out(n-1) == errorType {
		if !outs[n-1].IsNil() {
			return "", outs[n-1].Interface().(error)
		}
		outs = outs[:n-1]
	}
	switch len(outs) {
	case 0:
		return "null", nil
	case 1:
		return scalesEncode(outs[0].Interface()), nil
	}
	values := make([]interface{}, len(outs))
	for i, out := range outs {
		values[i] = out.Interface()
	}
	return scalesEncode(values), nil
}

func scalesMatches(actual, expectedText string) bool {
	var expected, got interface{}
	if scalesjson.Unmarshal([]byte(expectedText), &expected) != nil {
		return actual == expectedText
	}
	if scalesjson.Unmarshal([]byte(actual), &got) != nil {
		return false
	}
	return scalesreflect.DeepEqual(expected, got)
}

func scalesRunCase(index int, inputText, expectedText string) bool {
	scalesfmt.Printf("Test %d\n", index)
	actual, err := scalesCall(@ENTRY@, inputText)
	passed := err == nil && scalesMatches(actual, expectedText)
	if err != nil {
		actual = "Error: " + err.Error()
	}
	if passed {
		scalesLine("✅ PASSED")
	} else {
		scalesLine("❌ FAILED")
		scalesLine("Expected: " + expectedText)
		scalesLine("Got: " + actual)
	}
	return passed
}

func main() {
	allPassed := true
)";

constexpr std::string_view kEpilogue = R"(
	if !allPassed {
		scalesos.Exit(1)
	}
}
)";

auto IsCommentOrBlank(std::string_view line) -> bool {
  auto trimmed = common::Trim(line);
  return trimmed.empty() || trimmed.starts_with("//");
}

}  // namespace

auto StripPackageClause(std::string_view code) -> std::string {
  size_t pos = 0;
  while (pos < code.size()) {
    size_t end = code.find('\n', pos);
    if (end == std::string_view::npos) {
      end = code.size();
    }
    auto line = code.substr(pos, end - pos);
    if (IsCommentOrBlank(line)) {
      pos = end + 1;
      continue;
    }
    if (common::Trim(line).starts_with("package ")) {
      std::string result(code.substr(0, pos));
      if (end < code.size()) {
        result += code.substr(end + 1);
      }
      return result;
    }
    break;
  }
  return std::string(code);
}

auto GoHarness::Language() const -> std::string {
  return "go";
}

auto GoHarness::SourceFileName() const -> std::string {
  return "main.go";
}

auto GoHarness::DefaultCommand() const -> std::vector<std::string> {
  return {"go", "run", "{file}"};
}

auto GoHarness::FunctionName(std::string_view code) const -> std::string {
  static const std::regex kPattern(R"(func\s+([a-zA-Z0-9_]+)\s*\()");
  return FirstCapture(kPattern, code);
}

auto GoHarness::Generate(
    const Problem& problem, std::string_view code,
    std::string_view entry_point) const -> Result<std::string> {
  if (auto valid = ValidateEntryPoint(entry_point, false); !valid) {
    return std::unexpected(std::move(valid.error()));
  }

  std::string source(kPrologue);
  source += StripPackageClause(code);
  source += common::ReplaceAll(std::string(kDriver), "@ENTRY@", entry_point);

  for (size_t i = 0; i < problem.test_cases.size(); ++i) {
    const auto& test_case = problem.test_cases[i];
    source += std::format(
        "\n\t// Test case {0}\n"
        "\tif !scalesRunCase({0}, {1}, {2}) {{\n"
        "\t\tallPassed = false\n"
        "\t}}\n",
        i + 1, common::QuoteLiteral(test_case.input),
        common::QuoteLiteral(test_case.expected));
  }
  source += kEpilogue;
  return source;
}

}  // namespace scales::harness
