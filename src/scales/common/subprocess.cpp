#include "scales/common/subprocess.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// POSIX headers
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "scales/common/error.hpp"

namespace scales::common {

namespace {

using Clock = std::chrono::steady_clock;

// Upper bound on a single poll() so that stop requests are noticed promptly.
constexpr int kPollSliceMs = 20;

// Longer timeouts are clamped so the deadline stays representable.
constexpr std::chrono::milliseconds kMaxTimeout =
    std::chrono::hours(24 * 365);

// Owns the parent side of a pipe; closes on scope exit.
class PipeEnd {
 public:
  PipeEnd() = default;
  explicit PipeEnd(int fd) : fd_(fd) {
  }
  ~PipeEnd() {
    Close();
  }

  PipeEnd(const PipeEnd&) = delete;
  auto operator=(const PipeEnd&) -> PipeEnd& = delete;
  PipeEnd(PipeEnd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {
  }
  auto operator=(PipeEnd&& other) noexcept -> PipeEnd& {
    if (this != &other) {
      Close();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  [[nodiscard]] auto Get() const -> int {
    return fd_;
  }
  [[nodiscard]] auto IsOpen() const -> bool {
    return fd_ >= 0;
  }

  void Close() {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_ = -1;
};

struct Pipe {
  PipeEnd read;
  PipeEnd write;
};

auto MakePipe() -> std::optional<Pipe> {
  std::array<int, 2> fds{};
  if (pipe2(fds.data(), O_CLOEXEC) != 0) {
    return std::nullopt;
  }
  return Pipe{.read = PipeEnd(fds[0]), .write = PipeEnd(fds[1])};
}

// Appends everything currently readable. Closes the pipe on EOF or error.
void Drain(PipeEnd& end, std::string& sink, size_t cap, bool& truncated) {
  std::array<char, 4096> buffer{};
  while (end.IsOpen()) {
    ssize_t bytes_read = read(end.Get(), buffer.data(), buffer.size());
    if (bytes_read > 0) {
      auto count = static_cast<size_t>(bytes_read);
      size_t room = sink.size() < cap ? cap - sink.size() : 0;
      if (count > room) {
        truncated = true;
      }
      sink.append(buffer.data(), std::min(count, room));
      continue;
    }
    if (bytes_read == 0) {
      end.Close();
      return;
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return;
    }
    end.Close();
  }
}

auto SetNonBlocking(int fd) -> bool {
  int flags = fcntl(fd, F_GETFL);
  return flags != -1 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

auto BuildArgv(const std::vector<std::string>& argv) -> std::vector<char*> {
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);
  return c_argv;
}

auto SpawnDirect(
    std::vector<char*>& c_argv, const Pipe& out, const Pipe& err)
    -> Result<pid_t> {
  posix_spawn_file_actions_t actions{};
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(
      &actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out.write.Get(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err.write.Get(), STDERR_FILENO);

  posix_spawnattr_t attr{};
  posix_spawnattr_init(&attr);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
  posix_spawnattr_setpgroup(&attr, 0);

  pid_t pid = 0;
  // NOLINTNEXTLINE(misc-include-cleaner) - environ is from unistd.h
  int spawn_result =
      posix_spawnp(&pid, c_argv[0], &actions, &attr, c_argv.data(), environ);

  posix_spawnattr_destroy(&attr);
  posix_spawn_file_actions_destroy(&actions);

  if (spawn_result != 0) {
    return std::unexpected(
        Error::Toolchain(
            std::format(
                "failed to start '{}': {}", c_argv[0],
                std::strerror(spawn_result))));
  }
  return pid;
}

// fork+exec when a working directory is requested
// (posix_spawn_file_actions_addchdir_np is a GNU extension).
// Exec failures travel back through a close-on-exec pipe so that a missing
// toolchain is not mistaken for a program exiting with 127.
auto SpawnInDirectory(
    std::vector<char*>& c_argv, const Pipe& out, const Pipe& err,
    const std::filesystem::path& working_dir) -> Result<pid_t> {
  auto status_pipe = MakePipe();
  if (!status_pipe) {
    return std::unexpected(
        Error::Setup(std::format("pipe() failed: {}", std::strerror(errno))));
  }
  std::string dir = working_dir.string();

  pid_t pid = fork();
  if (pid == -1) {
    return std::unexpected(
        Error::Setup(std::format("fork() failed: {}", std::strerror(errno))));
  }

  if (pid == 0) {
    // Child process
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      close(devnull);
    }
    dup2(out.write.Get(), STDOUT_FILENO);
    dup2(err.write.Get(), STDERR_FILENO);
    int child_errno = 0;
    if (chdir(dir.c_str()) != 0) {
      child_errno = errno;
    } else {
      execvp(c_argv[0], c_argv.data());
      child_errno = errno;
    }
    ssize_t ignored =
        write(status_pipe->write.Get(), &child_errno, sizeof(child_errno));
    (void)ignored;
    _exit(127);
  }

  setpgid(pid, pid);
  status_pipe->write.Close();

  int child_errno = 0;
  ssize_t bytes_read = 0;
  do {
    bytes_read =
        read(status_pipe->read.Get(), &child_errno, sizeof(child_errno));
  } while (bytes_read == -1 && errno == EINTR);

  if (bytes_read > 0) {
    int status = 0;
    waitpid(pid, &status, 0);
    return std::unexpected(
        Error::Toolchain(
            std::format(
                "failed to start '{}' in {}: {}", c_argv[0], dir,
                std::strerror(child_errno))));
  }
  return pid;
}

void KillGroup(pid_t pid) {
  // The child leads its own group; take down anything it started.
  if (kill(-pid, SIGKILL) != 0) {
    kill(pid, SIGKILL);
  }
}

// After the leader is reaped only its group id remains to signal. ESRCH
// means nothing was left behind.
void KillOrphans(pid_t pgid) {
  kill(-pgid, SIGKILL);
}

auto WaitBlocking(pid_t pid) -> int {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      break;
    }
  }
  return status;
}

}  // namespace

auto ToString(Termination termination) -> const char* {
  switch (termination) {
    case Termination::kExited:
      return "exited";
    case Termination::kSignaled:
      return "signaled";
    case Termination::kTimedOut:
      return "timed out";
    case Termination::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

auto PosixProcessExecutor::Run(
    const std::vector<std::string>& argv, const ProcessOptions& options)
    -> Result<ProcessResult> {
  if (argv.empty() || argv.front().empty()) {
    return std::unexpected(Error::InvalidArgument("empty command line"));
  }

  auto out = MakePipe();
  auto err = MakePipe();
  if (!out || !err) {
    return std::unexpected(
        Error::Setup(std::format("pipe() failed: {}", std::strerror(errno))));
  }

  auto c_argv = BuildArgv(argv);
  auto start = Clock::now();
  auto spawned = options.working_dir.has_value()
                     ? SpawnInDirectory(c_argv, *out, *err, *options.working_dir)
                     : SpawnDirect(c_argv, *out, *err);
  if (!spawned) {
    return std::unexpected(std::move(spawned.error()));
  }
  pid_t pid = *spawned;

  // Close write ends in parent so EOF arrives when the child is done
  out->write.Close();
  err->write.Close();
  SetNonBlocking(out->read.Get());
  SetNonBlocking(err->read.Get());

  ProcessResult result;
  auto deadline =
      start + std::clamp(options.timeout, std::chrono::milliseconds{0},
                         kMaxTimeout);
  bool reaped = false;
  int status = 0;

  while (true) {
    if (options.stop_token.stop_requested()) {
      result.termination = Termination::kCancelled;
      break;
    }
    auto now = Clock::now();
    if (now >= deadline) {
      result.termination = Termination::kTimedOut;
      break;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    int slice = static_cast<int>(
        std::clamp<std::chrono::milliseconds::rep>(
            remaining.count(), 1, kPollSliceMs));

    pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == -1 && errno != EINTR) {
      status = WaitBlocking(pid);
      waited = pid;
    }
    if (waited == pid) {
      reaped = true;
      // Everything the child wrote is already in the pipes. Descendants that
      // still hold them open must not keep the run alive.
      Drain(out->read, result.stdout_text, options.max_output_bytes,
            result.truncated);
      Drain(err->read, result.stderr_text, options.max_output_bytes,
            result.truncated);
      KillOrphans(pid);
      break;
    }

    if (!out->read.IsOpen() && !err->read.IsOpen()) {
      poll(nullptr, 0, slice);
      continue;
    }

    std::array<pollfd, 2> fds = {
        pollfd{.fd = out->read.Get(), .events = POLLIN, .revents = 0},
        pollfd{.fd = err->read.Get(), .events = POLLIN, .revents = 0},
    };
    int ready = poll(fds.data(), fds.size(), slice);
    if (ready < 0) {
      if (errno != EINTR) {
        // Stop reading; the exit status is still collected above.
        out->read.Close();
        err->read.Close();
      }
      continue;
    }
    if (fds[0].revents != 0) {
      Drain(out->read, result.stdout_text, options.max_output_bytes,
            result.truncated);
    }
    if (fds[1].revents != 0) {
      Drain(err->read, result.stderr_text, options.max_output_bytes,
            result.truncated);
    }
  }

  if (!reaped) {
    KillGroup(pid);
    status = WaitBlocking(pid);
    // Collect whatever was flushed before the kill
    Drain(out->read, result.stdout_text, options.max_output_bytes,
          result.truncated);
    Drain(err->read, result.stderr_text, options.max_output_bytes,
          result.truncated);
  }
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      Clock::now() - start);

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
    if (reaped) {
      result.termination = Termination::kSignaled;
    }
  }
  return result;
}

}  // namespace scales::common
