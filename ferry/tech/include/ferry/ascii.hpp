#pragma once

#include <cstddef>
#include <string_view>

namespace ferry {

constexpr char tolower(char ch) {
  auto uch = static_cast<unsigned char>(ch);
  if (uch >= 'A' && uch <= 'Z') {
    uch |= 0x20;
  }
  return static_cast<char>(uch);
}

constexpr bool IsAsciiSpace(char ch) { return ch == ' ' || ch == '\t'; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos < lhs.size(); ++pos) {
    if (tolower(lhs[pos]) != tolower(rhs[pos])) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Returns the position of the first case-insensitive occurrence of 'needle' in 'haystack', or npos.
constexpr std::size_t FindCaseInsensitive(std::string_view haystack, std::string_view needle) {
  if (needle.size() > haystack.size()) {
    return std::string_view::npos;
  }
  for (std::size_t pos = 0; pos + needle.size() <= haystack.size(); ++pos) {
    if (CaseInsensitiveEqual(haystack.substr(pos, needle.size()), needle)) {
      return pos;
    }
  }
  return std::string_view::npos;
}

// Strips leading and trailing spaces / horizontal tabs.
constexpr std::string_view TrimOws(std::string_view value) {
  while (!value.empty() && IsAsciiSpace(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && IsAsciiSpace(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

constexpr std::string_view StripQuotes(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value.remove_prefix(1);
    value.remove_suffix(1);
  }
  return value;
}

}  // namespace ferry
