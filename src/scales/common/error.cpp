#include "scales/common/error.hpp"

#include <string>

namespace scales {

auto ToString(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::kSetup:
      return "setup";
    case ErrorKind::kToolchain:
      return "toolchain";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kCancelled:
      return "cancelled";
    case ErrorKind::kUnknownLanguage:
      return "unknown_language";
    case ErrorKind::kInvalidArgument:
      return "invalid_argument";
    case ErrorKind::kConfig:
      return "config";
    case ErrorKind::kCatalog:
      return "catalog";
  }
  return "unknown";
}

auto Error::Format() const -> std::string {
  std::string out = message;
  for (const auto& note : notes) {
    out += "\n  note: ";
    out += note;
  }
  return out;
}

}  // namespace scales
