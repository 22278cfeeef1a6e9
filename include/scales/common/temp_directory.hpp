#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "scales/common/error.hpp"

namespace scales::common {

// RAII guard for a freshly created, uniquely named directory. The directory
// and its contents are removed on destruction unless `keep` was requested.
class ScopedTempDirectory {
 public:
  // mkdtemp under `parent` (the system temp dir when empty).
  static auto Create(
      const std::filesystem::path& parent, std::string_view prefix,
      bool keep = false) -> Result<ScopedTempDirectory>;

  ScopedTempDirectory(const ScopedTempDirectory&) = delete;
  auto operator=(const ScopedTempDirectory&) -> ScopedTempDirectory& = delete;

  ScopedTempDirectory(ScopedTempDirectory&& other) noexcept
      : path_(std::exchange(other.path_, {})), keep_(other.keep_) {
  }
  auto operator=(ScopedTempDirectory&& other) noexcept -> ScopedTempDirectory& {
    if (this != &other) {
      Cleanup();
      path_ = std::exchange(other.path_, {});
      keep_ = other.keep_;
    }
    return *this;
  }

  ~ScopedTempDirectory() noexcept {
    Cleanup();
  }

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

 private:
  ScopedTempDirectory(std::filesystem::path path, bool keep)
      : path_(std::move(path)), keep_(keep) {
  }

  void Cleanup() noexcept;

  std::filesystem::path path_;
  bool keep_ = false;
};

}  // namespace scales::common
