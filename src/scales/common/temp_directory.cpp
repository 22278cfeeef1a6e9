#include "scales/common/temp_directory.hpp"

#include <cerrno>
#include <cstring>
#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

// POSIX headers
#include <stdlib.h>  // NOLINT(modernize-deprecated-headers) - mkdtemp

#include "scales/common/error.hpp"

namespace scales::common {

namespace fs = std::filesystem;

auto ScopedTempDirectory::Create(
    const fs::path& parent, std::string_view prefix, bool keep)
    -> Result<ScopedTempDirectory> {
  std::error_code ec;
  fs::path base = parent.empty() ? fs::temp_directory_path(ec) : parent;
  if (ec) {
    return std::unexpected(
        Error::Setup(
            std::format(
                "failed to locate temp directory: {}", ec.message())));
  }
  fs::create_directories(base, ec);
  if (ec) {
    return std::unexpected(
        Error::Setup(
            std::format(
                "failed to create {}: {}", base.string(), ec.message())));
  }

  std::string tmpl = (base / std::string(prefix)).string() + "XXXXXX";
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  if (mkdtemp(buf.data()) == nullptr) {
    return std::unexpected(
        Error::Setup(
            std::format(
                "failed to create test directory {}: {}", tmpl,
                std::strerror(errno))));
  }
  return ScopedTempDirectory(fs::path(buf.data()), keep);
}

void ScopedTempDirectory::Cleanup() noexcept {
  if (path_.empty() || keep_) {
    return;
  }
  std::error_code ec;
  fs::remove_all(path_, ec);
  path_.clear();
}

}  // namespace scales::common
