#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "scales/common/error.hpp"
#include "scales/engine/test_result.hpp"
#include "tests/e2e/toolchain_fixture.hpp"

auto main(int argc, char** argv) -> int {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

namespace scales::test {
namespace {

class GoTest : public ToolchainTest {
 protected:
  GoTest() : ToolchainTest("go", "go") {
  }
};

TEST_F(GoTest, CorrectSolutionPasses) {
  auto outcome = Execute(R"(package main

import "sort"

func twoSum(nums []int, target int) []int {
	seen := map[int]int{}
	for i, n := range nums {
		if j, ok := seen[target-n]; ok {
			pair := []int{j, i}
			sort.Ints(pair)
			return pair
		}
		seen[n] = i
	}
	return nil
}
)");
  EXPECT_FALSE(outcome.HasError()) << outcome.error->message;
  EXPECT_TRUE(outcome.all_passed);
  EXPECT_EQ(outcome.results[1].actual, "[1,2]");
}

TEST_F(GoTest, WrongAnswerReportsGot) {
  auto outcome = Execute(
      "func twoSum(nums []int, target int) []int {\n"
      "\treturn []int{1, 0}\n"
      "}\n");
  EXPECT_FALSE(outcome.all_passed);
  EXPECT_EQ(outcome.results[0].actual, "[1,0]");
}

TEST_F(GoTest, ErrorReturnIsPerTestFailure) {
  auto outcome = Execute(R"(
import "errors"

func twoSum(nums []int, target int) ([]int, error) {
	if target == 6 {
		return nil, errors.New("no pair")
	}
	return []int{0, 1}, nil
}
)");
  EXPECT_TRUE(outcome.results[0].passed);
  EXPECT_EQ(outcome.results[1].actual, "Error: no pair");
}

TEST_F(GoTest, PanicIsPerTestFailure) {
  auto outcome = Execute(
      "func twoSum(nums []int, target int) []int {\n"
      "\treturn []int{nums[10]}\n"
      "}\n");
  EXPECT_FALSE(outcome.all_passed);
  EXPECT_TRUE(outcome.results[0].actual.starts_with("Error: panic: "))
      << outcome.results[0].actual;
}

TEST_F(GoTest, CompileErrorAttributesStderr) {
  auto outcome = Execute("func twoSum(nums []int, target int) []int {\n");
  EXPECT_FALSE(outcome.all_passed);
  for (const auto& result : outcome.results) {
    EXPECT_TRUE(result.actual.starts_with("Error: ")) << result.actual;
  }
}

}  // namespace
}  // namespace scales::test
