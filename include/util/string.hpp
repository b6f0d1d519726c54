#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace sysdmon::util {

const std::string WHITESPACE = " \n\r\t\f\v";

inline std::string ltrim(const std::string& s) {
  size_t begin = s.find_first_not_of(WHITESPACE);
  return (begin == std::string::npos) ? "" : s.substr(begin);
}

inline std::string rtrim(const std::string& s) {
  size_t end = s.find_last_not_of(WHITESPACE);
  return (end == std::string::npos) ? "" : s.substr(0, end + 1);
}

inline std::string trim(const std::string& s) { return rtrim(ltrim(s)); }

inline std::string toLower(const std::string& str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::vector<std::string> split(std::string_view s, std::string_view delimiter) {
  std::vector<std::string> result;
  size_t pos = 0;
  size_t next_pos = 0;
  while ((next_pos = s.find(delimiter, pos)) != std::string::npos) {
    result.emplace_back(s.substr(pos, next_pos - pos));
    pos = next_pos + delimiter.size();
  }
  result.emplace_back(s.substr(pos));
  return result;
}

// Everything after the last '.', or empty when there is none.
inline std::string suffix(const std::string& name) {
  auto dot = name.rfind('.');
  return dot == std::string::npos ? "" : name.substr(dot + 1);
}

// Replaces every occurrence of `from` in `str`.
inline std::string replaceAll(std::string str, const std::string& from, const std::string& to) {
  if (from.empty()) return str;
  size_t pos = 0;
  while ((pos = str.find(from, pos)) != std::string::npos) {
    str.replace(pos, from.size(), to);
    pos += to.size();
  }
  return str;
}

}  // namespace sysdmon::util
