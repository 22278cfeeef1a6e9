#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "scales/common/error.hpp"
#include "scales/common/subprocess.hpp"
#include "scales/common/temp_directory.hpp"

namespace scales::common {
namespace {

using namespace std::chrono_literals;

class SubprocessTest : public ::testing::Test {
 protected:
  auto Shell(const std::string& script, ProcessOptions options = {})
      -> Result<ProcessResult> {
    return executor_.Run({"/bin/sh", "-c", script}, options);
  }

  PosixProcessExecutor executor_;
};

// =============================================================================
// Normal Completion
// =============================================================================

TEST_F(SubprocessTest, CapturesStdoutAndStderrSeparately) {
  auto result = Shell("echo out; echo err >&2");
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(result->stdout_text, "out\n");
  EXPECT_EQ(result->stderr_text, "err\n");
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_EQ(result->termination, Termination::kExited);
  EXPECT_TRUE(result->Success());
  EXPECT_FALSE(result->truncated);
}

TEST_F(SubprocessTest, ReportsExitCode) {
  auto result = Shell("exit 3");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->exit_code, 3);
  EXPECT_EQ(result->termination, Termination::kExited);
  EXPECT_FALSE(result->Success());
}

TEST_F(SubprocessTest, StdinIsEmpty) {
  auto result = Shell("cat; echo done");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stdout_text, "done\n");
}

TEST_F(SubprocessTest, RunsInWorkingDirectory) {
  auto dir = ScopedTempDirectory::Create({}, "scales-subprocess-");
  ASSERT_TRUE(dir.has_value()) << dir.error().message;

  ProcessOptions options;
  options.working_dir = dir->Path();
  auto result = Shell("pwd -P", options);
  ASSERT_TRUE(result.has_value()) << result.error().message;
  EXPECT_EQ(
      result->stdout_text,
      std::filesystem::canonical(dir->Path()).string() + "\n");
}

TEST_F(SubprocessTest, LargeOutputIsCapped) {
  ProcessOptions options;
  options.max_output_bytes = 1024;
  auto result = Shell("head -c 100000 /dev/zero", options);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->stdout_text.size(), 1024U);
  EXPECT_TRUE(result->truncated);
  EXPECT_EQ(result->exit_code, 0);
}

TEST_F(SubprocessTest, BackgroundedDescendantDoesNotDelayExit) {
  ProcessOptions options;
  options.timeout = 2s;
  auto result = Shell("echo hi; sleep 5 & exit 0", options);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->termination, Termination::kExited);
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_EQ(result->stdout_text, "hi\n");
  EXPECT_LT(result->elapsed, 1500ms);
}

TEST_F(SubprocessTest, MaximumTimeoutDoesNotExpireImmediately) {
  ProcessOptions options;
  options.timeout = std::chrono::milliseconds::max();
  auto result = Shell("echo ok", options);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->termination, Termination::kExited);
  EXPECT_EQ(result->stdout_text, "ok\n");
}

TEST_F(SubprocessTest, KilledBySignal) {
  auto result = Shell("kill -9 $$");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->termination, Termination::kSignaled);
  EXPECT_EQ(result->exit_code, 128 + 9);
}

// =============================================================================
// Timeout and Cancellation
// =============================================================================

TEST_F(SubprocessTest, TimeoutKillsProcessGroup) {
  ProcessOptions options;
  options.timeout = 200ms;
  auto start = std::chrono::steady_clock::now();
  auto result = Shell("echo started; sleep 10 & wait", options);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->termination, Termination::kTimedOut);
  EXPECT_EQ(result->stdout_text, "started\n");
  EXPECT_LT(elapsed, 5s);
}

TEST_F(SubprocessTest, StopTokenCancelsRun) {
  std::stop_source source;
  ProcessOptions options;
  options.timeout = 10s;
  options.stop_token = source.get_token();

  std::jthread canceller([&source] {
    std::this_thread::sleep_for(100ms);
    source.request_stop();
  });
  auto start = std::chrono::steady_clock::now();
  auto result = Shell("sleep 10", options);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->termination, Termination::kCancelled);
  EXPECT_LT(elapsed, 5s);
}

// =============================================================================
// Start Failures
// =============================================================================

TEST_F(SubprocessTest, MissingProgramIsToolchainError) {
  auto result =
      executor_.Run({"scales-definitely-not-installed"}, ProcessOptions{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::kToolchain);
}

TEST_F(SubprocessTest, MissingProgramInWorkingDirectoryIsToolchainError) {
  auto dir = ScopedTempDirectory::Create({}, "scales-subprocess-");
  ASSERT_TRUE(dir.has_value());

  ProcessOptions options;
  options.working_dir = dir->Path();
  auto result = executor_.Run({"scales-definitely-not-installed"}, options);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::kToolchain);
}

TEST_F(SubprocessTest, EmptyCommandRejected) {
  auto result = executor_.Run({}, ProcessOptions{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().kind, ErrorKind::kInvalidArgument);
}

// =============================================================================
// Temp Directories
// =============================================================================

TEST(ScopedTempDirectoryTest, RemovedOnDestruction) {
  std::filesystem::path path;
  {
    auto dir = ScopedTempDirectory::Create({}, "scales-tmp-");
    ASSERT_TRUE(dir.has_value());
    path = dir->Path();
    EXPECT_TRUE(std::filesystem::is_directory(path));
    EXPECT_TRUE(path.filename().string().starts_with("scales-tmp-"));
  }
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(ScopedTempDirectoryTest, KeepLeavesDirectory) {
  std::filesystem::path path;
  {
    auto dir = ScopedTempDirectory::Create({}, "scales-tmp-", true);
    ASSERT_TRUE(dir.has_value());
    path = dir->Path();
  }
  EXPECT_TRUE(std::filesystem::exists(path));
  std::filesystem::remove_all(path);
}

TEST(ScopedTempDirectoryTest, UnusableParentIsSetupError) {
  auto holder = ScopedTempDirectory::Create({}, "scales-tmp-");
  ASSERT_TRUE(holder.has_value());
  auto blocker = holder->Path() / "blocker";
  std::ofstream(blocker) << "not a directory";

  auto dir = ScopedTempDirectory::Create(blocker / "sub", "scales-");
  ASSERT_FALSE(dir.has_value());
  EXPECT_EQ(dir.error().kind, ErrorKind::kSetup);
}

}  // namespace
}  // namespace scales::common
