#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace sshprom {
namespace stringutil {

// Trim leading and trailing whitespace from a string
inline void trim(std::string &str) {
  auto start = std::find_if_not(str.begin(), str.end(), ::isspace);
  auto end = std::find_if_not(str.rbegin(), str.rend(), ::isspace).base();
  str = start < end ? std::string(start, end) : std::string{};
}

inline std::string trim_copy(std::string str) {
  trim(str);
  return str;
}

// Strips every leading and trailing character found in chars.
inline std::string strip_copy(std::string_view str, std::string_view chars) {
  const auto first = str.find_first_not_of(chars);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = str.find_last_not_of(chars);
  return std::string(str.substr(first, last - first + 1));
}

inline std::string toLowerCase(const std::string &str) {
  std::string result;
  result.reserve(str.size());
  for (char c : str) {
    result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return result;
}

} // namespace stringutil
} // namespace sshprom
