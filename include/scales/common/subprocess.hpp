#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "scales/common/error.hpp"

namespace scales::common {

// How the child process ended.
enum class Termination {
  kExited,     // Exited on its own, exit_code is valid
  kSignaled,   // Killed by a signal it did not get from us
  kTimedOut,   // Killed after the deadline expired
  kCancelled,  // Killed after a stop was requested
};

auto ToString(Termination termination) -> const char*;

struct ProcessOptions {
  std::chrono::milliseconds timeout{30000};
  std::optional<std::filesystem::path> working_dir;
  // Per stream. Output past the cap is drained and discarded.
  size_t max_output_bytes = size_t{1} << 20;
  std::stop_token stop_token;
};

struct ProcessResult {
  std::string stdout_text;
  std::string stderr_text;
  int exit_code = -1;
  Termination termination = Termination::kExited;
  bool truncated = false;
  std::chrono::milliseconds elapsed{0};

  [[nodiscard]] auto Success() const -> bool {
    return termination == Termination::kExited && exit_code == 0;
  }
};

// Runs an external command with bounded wall-clock time.
class ProcessExecutor {
 public:
  ProcessExecutor() = default;
  virtual ~ProcessExecutor() = default;

  ProcessExecutor(const ProcessExecutor&) = delete;
  auto operator=(const ProcessExecutor&) -> ProcessExecutor& = delete;
  ProcessExecutor(ProcessExecutor&&) = delete;
  auto operator=(ProcessExecutor&&) -> ProcessExecutor& = delete;

  // argv[0] is resolved through PATH, no shell interpretation.
  // Fails only when the process cannot be started (ErrorKind::kToolchain).
  // Timeout and cancellation are reported through ProcessResult together
  // with whatever output was captured before the kill.
  [[nodiscard]] virtual auto Run(
      const std::vector<std::string>& argv, const ProcessOptions& options)
      -> Result<ProcessResult> = 0;
};

// posix_spawn based executor. The child runs in its own process group so
// that a timeout kills everything the toolchain started.
class PosixProcessExecutor final : public ProcessExecutor {
 public:
  [[nodiscard]] auto Run(
      const std::vector<std::string>& argv, const ProcessOptions& options)
      -> Result<ProcessResult> override;
};

}  // namespace scales::common
