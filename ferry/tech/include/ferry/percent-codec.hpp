#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ferry {

/// Decode a single hexadecimal digit. Returns -1 if invalid.
constexpr int FromHexDigit(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  return -1;
}

// Decodes %XX escapes of 'encoded'. '+' is kept as is (it is not a space in paths nor in filenames).
// Returns std::nullopt if a '%' is not followed by two hexadecimal digits.
[[nodiscard]] std::optional<std::string> PercentDecode(std::string_view encoded);

// Encodes every byte outside the RFC 5987 attr-char set as upper case %XX.
// The result is suitable for a filename*=UTF-8''<value> parameter.
[[nodiscard]] std::string PercentEncodeAttrChars(std::string_view value);

}  // namespace ferry
