#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "scales/common/error.hpp"
#include "scales/common/subprocess.hpp"
#include "scales/common/temp_directory.hpp"
#include "scales/engine/harness/harness.hpp"
#include "scales/engine/runner.hpp"
#include "scales/engine/test_result.hpp"
#include "scales/problem/problem.hpp"

namespace scales {
namespace {

using namespace std::chrono_literals;

// A "language" whose solutions are shell scripts that speak the marker
// protocol themselves. Lets the runner be exercised without a real
// toolchain.
class ShellHarness final : public harness::HarnessGenerator {
 public:
  [[nodiscard]] auto Language() const -> std::string override {
    return "sh";
  }
  [[nodiscard]] auto SourceFileName() const -> std::string override {
    return "test_solution.sh";
  }
  [[nodiscard]] auto DefaultCommand() const
      -> std::vector<std::string> override {
    return {"/bin/sh", "{file}"};
  }
  [[nodiscard]] auto FunctionName(std::string_view code) const
      -> std::string override {
    return code.starts_with("# entry ") ? "custom" : "";
  }
  [[nodiscard]] auto Generate(
      const Problem& /*problem*/, std::string_view code,
      std::string_view entry_point) const -> Result<std::string> override {
    if (code == "REJECT") {
      return std::unexpected(Error::Setup("cannot embed solution"));
    }
    return std::format("# {}\n{}", entry_point, code);
  }
};

// Records the request and replays a canned result.
class FakeExecutor final : public common::ProcessExecutor {
 public:
  explicit FakeExecutor(Result<common::ProcessResult> reply)
      : reply_(std::move(reply)) {
  }

  [[nodiscard]] auto Run(
      const std::vector<std::string>& argv,
      const common::ProcessOptions& options)
      -> Result<common::ProcessResult> override {
    argv_ = argv;
    timeout_ = options.timeout;
    working_dir_ = options.working_dir.value_or("");
    if (!argv.empty() && std::filesystem::exists(argv.back())) {
      std::ifstream in(argv.back());
      harness_.assign(
          std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    return reply_;
  }

  Result<common::ProcessResult> reply_;
  std::vector<std::string> argv_;
  std::chrono::milliseconds timeout_{0};
  std::filesystem::path working_dir_;
  std::string harness_;
};

class HarnessRunnerTest : public ::testing::Test {
 protected:
  auto MakeRunner(RunnerOptions options = {}) -> HarnessRunner {
    return HarnessRunner(
        std::make_unique<ShellHarness>(),
        std::make_shared<common::PosixProcessExecutor>(), std::move(options));
  }

  auto MakeRunner(
      std::shared_ptr<common::ProcessExecutor> executor,
      RunnerOptions options = {}) -> HarnessRunner {
    return HarnessRunner(
        std::make_unique<ShellHarness>(), std::move(executor),
        std::move(options));
  }

  Problem problem_{
      .id = "two-sum",
      .title = "Two Sum",
      .test_cases = {
          {.input = "[2,7,11,15], 9", .expected = "[0,1]"},
          {.input = "[3,2,4], 6", .expected = "[1,2]"},
      }};
};

// =============================================================================
// Harness Generation
// =============================================================================

TEST_F(HarnessRunnerTest, GenerateUsesDefaultFunctionWhenNoneDeclared) {
  auto runner = MakeRunner(RunnerOptions{.default_function = "twoSum"});
  auto source = runner.GenerateTestCode(problem_, "echo hi");
  ASSERT_TRUE(source.has_value());
  EXPECT_EQ(*source, "# twoSum\necho hi");
}

TEST_F(HarnessRunnerTest, GenerateUsesDeclaredFunction) {
  auto runner = MakeRunner();
  auto source = runner.GenerateTestCode(problem_, "# entry \necho hi");
  ASSERT_TRUE(source.has_value());
  EXPECT_TRUE(source->starts_with("# custom\n"));
}

TEST_F(HarnessRunnerTest, GenerateIsIdempotent) {
  auto runner = MakeRunner();
  EXPECT_EQ(
      runner.GenerateTestCode(problem_, "echo hi"),
      runner.GenerateTestCode(problem_, "echo hi"));
}

TEST_F(HarnessRunnerTest, BuildCommandSubstitutesPlaceholders) {
  auto runner = MakeRunner(
      RunnerOptions{.command = {"tool", "--cwd={dir}", "{file}", "-x"}});
  EXPECT_EQ(
      runner.BuildCommand("/w/main.sh", "/w"),
      (std::vector<std::string>{"tool", "--cwd=/w", "/w/main.sh", "-x"}));
}

TEST_F(HarnessRunnerTest, BuildCommandAppendsFileWithoutPlaceholder) {
  auto runner = MakeRunner(RunnerOptions{.command = {"bash", "-e"}});
  EXPECT_EQ(
      runner.BuildCommand("/w/main.sh", "/w"),
      (std::vector<std::string>{"bash", "-e", "/w/main.sh"}));
}

TEST_F(HarnessRunnerTest, BuildCommandFallsBackToGeneratorDefault) {
  auto runner = MakeRunner();
  EXPECT_EQ(
      runner.BuildCommand("/w/main.sh", "/w"),
      (std::vector<std::string>{"/bin/sh", "/w/main.sh"}));
}

// =============================================================================
// Execution
// =============================================================================

TEST_F(HarnessRunnerTest, AllTestsPass) {
  auto runner = MakeRunner();
  auto outcome = runner.ExecuteTests(
      problem_,
      "echo 'Test 1'; echo '✅ PASSED'; echo 'Test 2'; echo '✅ PASSED'", 10s);
  EXPECT_FALSE(outcome.HasError());
  EXPECT_TRUE(outcome.all_passed);
  ASSERT_EQ(outcome.results.size(), 2U);
  EXPECT_EQ(outcome.results[1].actual, "[1,2]");
}

TEST_F(HarnessRunnerTest, FailingTestIsNotAnEngineError) {
  auto runner = MakeRunner();
  auto outcome = runner.ExecuteTests(
      problem_,
      "echo 'Test 1'; echo '✅ PASSED'; echo 'Test 2'; echo '❌ FAILED';"
      "echo 'Got: [2,1]'; exit 1",
      10s);
  EXPECT_FALSE(outcome.HasError());
  EXPECT_FALSE(outcome.all_passed);
  EXPECT_TRUE(outcome.results[0].passed);
  EXPECT_EQ(outcome.results[1].actual, "[2,1]");
}

TEST_F(HarnessRunnerTest, CrashAttributesStderr) {
  auto runner = MakeRunner();
  auto outcome = runner.ExecuteTests(
      problem_, "echo 'Test 1'; echo '✅ PASSED'; echo boom >&2; exit 2", 10s);
  EXPECT_FALSE(outcome.HasError());
  EXPECT_FALSE(outcome.all_passed);
  EXPECT_TRUE(outcome.results[0].passed);
  EXPECT_EQ(outcome.results[1].actual, "Error: boom\n");
}

TEST_F(HarnessRunnerTest, StderrIgnoredOnCleanExit) {
  auto runner = MakeRunner();
  auto outcome = runner.ExecuteTests(
      problem_, "echo 'Test 2'; echo '❌ FAILED Got: 7'; echo note >&2", 10s);
  EXPECT_FALSE(outcome.HasError());
  EXPECT_EQ(outcome.results[0].actual, kNoOutputCaptured);
  EXPECT_EQ(outcome.results[1].actual, "7");
}

TEST_F(HarnessRunnerTest, HarnessRunsInsideRemovedWorkDirectory) {
  auto runner = MakeRunner();
  auto outcome = runner.ExecuteTests(
      problem_,
      "test -f ./test_solution.sh || exit 9\n"
      "echo 'Test 1'; echo '❌ FAILED'; echo \"Got: $(pwd)\"",
      10s);
  ASSERT_FALSE(outcome.HasError());
  const auto& dir = outcome.results[0].actual;
  EXPECT_NE(dir.find("scales-sh-"), std::string::npos) << dir;
  EXPECT_FALSE(std::filesystem::exists(dir));
}

TEST_F(HarnessRunnerTest, KeepTempLeavesWorkDirectory) {
  auto runner = MakeRunner(RunnerOptions{.keep_temp = true});
  auto outcome = runner.ExecuteTests(
      problem_, "echo 'Test 1'; echo '❌ FAILED'; echo \"Got: $(pwd)\"", 10s);
  const auto& dir = outcome.results[0].actual;
  ASSERT_TRUE(std::filesystem::exists(dir));
  EXPECT_TRUE(std::filesystem::exists(
      std::filesystem::path(dir) / "test_solution.sh"));
  std::filesystem::remove_all(dir);
}

TEST_F(HarnessRunnerTest, TimeoutReturnsPartialResults) {
  auto runner = MakeRunner();
  auto start = std::chrono::steady_clock::now();
  auto outcome = runner.ExecuteTests(
      problem_, "echo 'Test 1'; echo '✅ PASSED'; sleep 10", 300ms);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(outcome.HasError());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kTimeout);
  EXPECT_TRUE(outcome.error->IsSoft());
  EXPECT_FALSE(outcome.all_passed);
  ASSERT_EQ(outcome.results.size(), 2U);
  EXPECT_TRUE(outcome.results[0].passed);
  EXPECT_FALSE(outcome.results[1].passed);
  EXPECT_LT(elapsed, 5s);
}

TEST_F(HarnessRunnerTest, StopTokenCancelsExecution) {
  auto runner = MakeRunner();
  std::stop_source source;
  std::jthread canceller([&source] {
    std::this_thread::sleep_for(100ms);
    source.request_stop();
  });
  auto outcome =
      runner.ExecuteTests(problem_, "sleep 10", 10s, source.get_token());
  ASSERT_TRUE(outcome.HasError());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kCancelled);
  EXPECT_EQ(outcome.results.size(), 2U);
}

TEST_F(HarnessRunnerTest, MissingToolchainIsHardError) {
  auto runner = MakeRunner(
      RunnerOptions{.command = {"scales-definitely-not-installed", "{file}"}});
  auto outcome = runner.ExecuteTests(problem_, "echo hi", 10s);
  ASSERT_TRUE(outcome.HasError());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kToolchain);
  EXPECT_FALSE(outcome.error->IsSoft());
  ASSERT_EQ(outcome.error->notes.size(), 1U);
  EXPECT_TRUE(outcome.error->notes[0].starts_with(
      "command: scales-definitely-not-installed "))
      << outcome.error->notes[0];
  EXPECT_TRUE(outcome.error->notes[0].ends_with("/test_solution.sh"));
  EXPECT_FALSE(outcome.all_passed);
  ASSERT_EQ(outcome.results.size(), 2U);
  EXPECT_EQ(outcome.results[0].actual, kNoOutputCaptured);
}

TEST_F(HarnessRunnerTest, GenerationFailureIsSetupError) {
  auto runner = MakeRunner();
  auto outcome = runner.ExecuteTests(problem_, "REJECT", 10s);
  ASSERT_TRUE(outcome.HasError());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kSetup);
  EXPECT_EQ(outcome.results.size(), 2U);
}

TEST_F(HarnessRunnerTest, UnusableTempRootIsSetupError) {
  auto holder = common::ScopedTempDirectory::Create({}, "scales-runner-");
  ASSERT_TRUE(holder.has_value());
  auto blocker = holder->Path() / "blocker";
  std::ofstream(blocker) << "x";

  auto runner = MakeRunner(RunnerOptions{.temp_root = blocker / "sub"});
  auto outcome = runner.ExecuteTests(problem_, "echo hi", 10s);
  ASSERT_TRUE(outcome.HasError());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kSetup);
}

TEST_F(HarnessRunnerTest, EmptyProblemPassesTrivially) {
  auto runner = MakeRunner();
  Problem empty{.id = "empty"};
  auto outcome = runner.ExecuteTests(empty, "true", 10s);
  EXPECT_FALSE(outcome.HasError());
  EXPECT_TRUE(outcome.results.empty());
  EXPECT_TRUE(outcome.all_passed);
}

// =============================================================================
// Executor Seam
// =============================================================================

TEST_F(HarnessRunnerTest, PassesTimeoutAndWorkDirToExecutor) {
  auto executor = std::make_shared<FakeExecutor>(common::ProcessResult{
      .stdout_text = "Test 1\n✅ PASSED\nTest 2\n✅ PASSED\n", .exit_code = 0});
  auto runner = MakeRunner(executor);
  auto outcome = runner.ExecuteTests(problem_, "echo hi", 1234ms);

  EXPECT_TRUE(outcome.all_passed);
  EXPECT_EQ(executor->timeout_, 1234ms);
  ASSERT_EQ(executor->argv_.size(), 2U);
  EXPECT_EQ(executor->argv_[0], "/bin/sh");
  EXPECT_EQ(
      std::filesystem::path(executor->argv_[1]),
      executor->working_dir_ / "test_solution.sh");
  EXPECT_EQ(executor->harness_, "# solution\necho hi");
}

TEST_F(HarnessRunnerTest, ExecutorTimeoutMapsToTimeoutError) {
  auto executor = std::make_shared<FakeExecutor>(common::ProcessResult{
      .stdout_text = "Test 1\n✅ PASSED\n",
      .exit_code = 137,
      .termination = common::Termination::kTimedOut});
  auto runner = MakeRunner(executor);
  auto outcome = runner.ExecuteTests(problem_, "echo hi", 20s);
  ASSERT_TRUE(outcome.HasError());
  EXPECT_EQ(outcome.error->kind, ErrorKind::kTimeout);
  EXPECT_EQ(outcome.error->message, "test execution timed out after 20000ms");
  EXPECT_TRUE(outcome.results[0].passed);
}

TEST_F(HarnessRunnerTest, ExecutorStartFailureIsPropagated) {
  auto executor = std::make_shared<FakeExecutor>(
      std::unexpected(Error::Toolchain("failed to start 'go'")));
  auto runner = MakeRunner(executor);
  auto outcome = runner.ExecuteTests(problem_, "echo hi", 1s);
  ASSERT_TRUE(outcome.HasError());
  EXPECT_EQ(outcome.error->message, "failed to start 'go'");
}

}  // namespace
}  // namespace scales
