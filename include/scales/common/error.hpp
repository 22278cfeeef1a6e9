#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace scales {

// Category of an engine-level error. Test failures are never errors.
enum class ErrorKind : uint8_t {
  kSetup,            // Temp directory, harness generation or write failed
  kToolchain,        // Language toolchain could not be started
  kTimeout,          // Wall-clock limit expired, process was killed
  kCancelled,        // Caller requested cancellation
  kUnknownLanguage,  // No runner registered for the language
  kInvalidArgument,  // Malformed request (e.g. runner without language)
  kConfig,           // Malformed scales.toml
  kCatalog,          // Malformed or missing problem file
};

auto ToString(ErrorKind kind) -> const char*;

struct Error {
  ErrorKind kind;
  std::string message;
  std::vector<std::string> notes;

  auto operator==(const Error&) const -> bool = default;

  static auto Setup(std::string msg) -> Error {
    return Error{.kind = ErrorKind::kSetup, .message = std::move(msg)};
  }

  static auto Toolchain(std::string msg) -> Error {
    return Error{.kind = ErrorKind::kToolchain, .message = std::move(msg)};
  }

  static auto Timeout(std::string msg) -> Error {
    return Error{.kind = ErrorKind::kTimeout, .message = std::move(msg)};
  }

  static auto Cancelled(std::string msg) -> Error {
    return Error{.kind = ErrorKind::kCancelled, .message = std::move(msg)};
  }

  static auto UnknownLanguage(std::string msg) -> Error {
    return Error{
        .kind = ErrorKind::kUnknownLanguage, .message = std::move(msg)};
  }

  static auto InvalidArgument(std::string msg) -> Error {
    return Error{
        .kind = ErrorKind::kInvalidArgument, .message = std::move(msg)};
  }

  static auto Config(std::string msg) -> Error {
    return Error{.kind = ErrorKind::kConfig, .message = std::move(msg)};
  }

  static auto Catalog(std::string msg) -> Error {
    return Error{.kind = ErrorKind::kCatalog, .message = std::move(msg)};
  }

  auto WithNote(std::string msg) && -> Error {
    notes.push_back(std::move(msg));
    return std::move(*this);
  }

  // Timeout and cancellation still come with partial results.
  [[nodiscard]] auto IsSoft() const -> bool {
    return kind == ErrorKind::kTimeout || kind == ErrorKind::kCancelled;
  }

  [[nodiscard]] auto Format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

class ErrorException : public std::exception {
 public:
  explicit ErrorException(Error error) : error_(std::move(error)) {
  }

  [[nodiscard]] auto GetError() const -> const Error& {
    return error_;
  }

  [[nodiscard]] auto what() const noexcept -> const char* override {
    return error_.message.c_str();
  }

 private:
  Error error_;
};

}  // namespace scales
