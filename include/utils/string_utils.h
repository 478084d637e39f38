#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline std::string trimRight(std::string_view str) {
  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();
  return std::string(str.begin(), end);
}

// Left-justifies value in a blank padded field of exactly width characters.
inline std::string padRight(std::string_view value, size_t width) {
  std::string result{value.substr(0, std::min(value.size(), width))};
  result.append(width - result.size(), ' ');
  return result;
}

inline std::vector<std::string> split(std::string_view str, char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= str.size()) {
    size_t pos = str.find(delimiter, start);
    if (pos == std::string_view::npos)
      pos = str.size();
    std::string part = trim(str.substr(start, pos - start));
    if (!part.empty())
      parts.push_back(std::move(part));
    start = pos + 1;
  }
  return parts;
}

// IBM i system object names: up to 10 characters from A-Z, 0-9, _ $ # @,
// not starting with a digit or underscore.
inline bool isValidSystemName(std::string_view name) {
  if (name.empty() || name.length() > 10) {
    return false;
  }

  for (char c : name) {
    if (!((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
          (c >= '0' && c <= '9') || c == '_' || c == '$' || c == '#' ||
          c == '@')) {
      return false;
    }
  }

  return !((name[0] >= '0' && name[0] <= '9') || name[0] == '_');
}

inline bool isValidSqlIdentifier(std::string_view identifier) {
  if (identifier.empty() || identifier.length() > 128) {
    return false;
  }

  for (char c : identifier) {
    if (!((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
          (c >= '0' && c <= '9') || c == '_' || c == '$' || c == '#' ||
          c == '@')) {
      return false;
    }
  }

  return !(identifier[0] >= '0' && identifier[0] <= '9');
}

} // namespace StringUtils

#endif
