#include "ferry/percent-codec.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace ferry {

namespace {

// attr-char from RFC 5987: ALPHA / DIGIT / "!" / "#" / "$" / "&" / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
constexpr bool IsAttrChar(char ch) {
  if ((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '&':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

}  // namespace

std::optional<std::string> PercentDecode(std::string_view encoded) {
  std::string out;
  out.reserve(encoded.size());
  for (std::size_t pos = 0; pos < encoded.size(); ++pos) {
    const char ch = encoded[pos];
    if (ch != '%') {
      out.push_back(ch);
      continue;
    }
    if (pos + 2U >= encoded.size()) {
      return std::nullopt;
    }
    const int high = FromHexDigit(encoded[pos + 1U]);
    const int low = FromHexDigit(encoded[pos + 2U]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<char>((high << 4) | low));
    pos += 2U;
  }
  return out;
}

std::string PercentEncodeAttrChars(std::string_view value) {
  static constexpr const char* const kHexits = "0123456789ABCDEF";

  std::string out;
  out.reserve(value.size() * 3U);
  for (char ch : value) {
    if (IsAttrChar(ch)) {
      out.push_back(ch);
    } else {
      const auto uch = static_cast<unsigned char>(ch);
      out.push_back('%');
      out.push_back(kHexits[uch >> 4U]);
      out.push_back(kHexits[uch & 0x0FU]);
    }
  }
  return out;
}

}  // namespace ferry
