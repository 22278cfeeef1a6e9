#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace scales::common {

// Exception type for internal engine errors (bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in scales, please report it.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace scales::common
