#include "scales/engine/harness/harness.hpp"

#include <cctype>
#include <expected>
#include <format>
#include <regex>
#include <string>
#include <string_view>

#include "scales/common/error.hpp"

namespace scales::harness {

auto FirstCapture(const std::regex& pattern, std::string_view code)
    -> std::string {
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(code.begin(), code.end(), match, pattern)) {
    return "";
  }
  for (size_t i = 1; i < match.size(); ++i) {
    if (match[i].matched && match[i].length() > 0) {
      return match[i].str();
    }
  }
  return "";
}

auto ValidateEntryPoint(std::string_view entry_point, bool allow_dollar)
    -> Result<void> {
  auto is_start = [&](unsigned char c) {
    return std::isalpha(c) != 0 || c == '_' || (allow_dollar && c == '$');
  };
  auto is_rest = [&](unsigned char c) {
    return is_start(c) || std::isdigit(c) != 0;
  };

  bool valid = !entry_point.empty() &&
               is_start(static_cast<unsigned char>(entry_point.front()));
  for (char c : entry_point) {
    valid = valid && is_rest(static_cast<unsigned char>(c));
  }
  if (!valid) {
    return std::unexpected(
        Error::Setup(
            std::format(
                "cannot use '{}' as the solution entry point", entry_point)));
  }
  return {};
}

}  // namespace scales::harness
