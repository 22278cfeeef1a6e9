#pragma once

#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace scales::common {

// Quote a string as a double-quoted literal. The escape set (backslash,
// quote, \n \r \t and \u00XX for other control bytes) is accepted by Python,
// JavaScript and Go alike. Bytes >= 0x80 pass through, so UTF-8 survives.
inline auto QuoteLiteral(std::string_view s) -> std::string {
  constexpr std::array<char, 16> kHex = {
      '0', '1', '2', '3', '4', '5', '6', '7',
      '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string result;
  result.reserve(s.size() + (s.size() / 10) + 2);
  result += '"';
  for (char c : s) {
    switch (c) {
      case '\\':
        result += "\\\\";
        break;
      case '"':
        result += "\\\"";
        break;
      case '\n':
        result += "\\n";
        break;
      case '\r':
        result += "\\r";
        break;
      case '\t':
        result += "\\t";
        break;
      default: {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f) {
          result += "\\u00";
          result += kHex[byte >> 4];
          result += kHex[byte & 0xf];
        } else {
          result += c;
        }
        break;
      }
    }
  }
  result += '"';
  return result;
}

inline auto Trim(std::string_view sv) -> std::string_view {
  while (!sv.empty() &&
         std::isspace(static_cast<unsigned char>(sv.front())) != 0) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() &&
         std::isspace(static_cast<unsigned char>(sv.back())) != 0) {
    sv.remove_suffix(1);
  }
  return sv;
}

inline auto ReplaceAll(
    std::string text, std::string_view from, std::string_view to)
    -> std::string {
  if (from.empty()) {
    return text;
  }
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

}  // namespace scales::common
