#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::utf8 {

// Returns true if 'data' is well-formed UTF-8 (RFC 3629: no overlong forms, no surrogates, <= U+10FFFF).
[[nodiscard]] bool IsValid(std::string_view data) noexcept;

// Number of code points outside the ASCII range. Counting stops at the first malformed sequence.
[[nodiscard]] std::size_t CountNonAscii(std::string_view data) noexcept;

// Number of code points belonging to East Asian scripts (CJK ideographs and their extensions,
// compatibility ideographs, CJK symbols and punctuation, Hiragana, Katakana, Hangul syllables,
// half / full width forms). Counting stops at the first malformed sequence.
[[nodiscard]] std::size_t CountCjk(std::string_view data) noexcept;

// Interprets each byte of 'data' as an ISO-8859-1 character and returns its UTF-8 encoding.
[[nodiscard]] std::string FromLatin1(std::string_view data);

// Reverse of FromLatin1: if every code point of the valid UTF-8 'data' is <= U+00FF, returns the string made of
// one byte per code point. Returns std::nullopt otherwise.
[[nodiscard]] std::optional<std::string> ToLatin1(std::string_view data);

struct TranscodeResult {
  enum class Status : uint8_t {
    Ok,
    // The charset name is not known to iconv(3).
    UnknownCharset,
    // 'data' is not a valid or complete sequence in the charset.
    InvalidInput
  };

  std::string text;
  Status status{Status::Ok};
};

// Converts 'data', encoded in the IANA charset 'charset' (GBK, Shift_JIS, windows-1252...), to UTF-8 with iconv(3).
// 'text' is only meaningful when status is Ok.
[[nodiscard]] TranscodeResult FromCharset(std::string_view charset, std::string_view data);

}  // namespace ferry::utf8
