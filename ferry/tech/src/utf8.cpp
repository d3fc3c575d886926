#include "ferry/utf8.hpp"

#include <iconv.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ferry::utf8 {

namespace {

// Decodes the code point starting at 'ptr' and advances it. Returns false on malformed input (RFC 3629).
bool DecodeNext(const uint8_t*& ptr, const uint8_t* end, char32_t& codepoint) noexcept {
  uint8_t byte = *ptr++;
  if (byte <= 0x7F) {
    codepoint = byte;
    return true;
  }

  std::size_t remaining;
  char32_t minCodepoint;
  if ((byte & 0xE0) == 0xC0) {
    remaining = 1;
    codepoint = byte & 0x1FU;
    minCodepoint = 0x80;
  } else if ((byte & 0xF0) == 0xE0) {
    remaining = 2;
    codepoint = byte & 0x0FU;
    minCodepoint = 0x800;
  } else if ((byte & 0xF8) == 0xF0) {
    remaining = 3;
    codepoint = byte & 0x07U;
    minCodepoint = 0x10000;
  } else {
    return false;
  }

  if (static_cast<std::size_t>(end - ptr) < remaining) {
    return false;
  }
  for (std::size_t idx = 0; idx < remaining; ++idx) {
    byte = *ptr++;
    if ((byte & 0xC0) != 0x80) {
      return false;
    }
    codepoint = (codepoint << 6) | (byte & 0x3FU);
  }

  // overlong forms, surrogates, out of range
  return codepoint >= minCodepoint && (codepoint < 0xD800 || codepoint > 0xDFFF) && codepoint <= 0x10FFFF;
}

template <class Func>
bool ForEachCodepoint(std::string_view data, Func func) noexcept {
  const auto* ptr = reinterpret_cast<const uint8_t*>(data.data());
  const auto* end = ptr + data.size();
  while (ptr < end) {
    char32_t codepoint;
    if (!DecodeNext(ptr, end, codepoint)) {
      return false;
    }
    func(codepoint);
  }
  return true;
}

constexpr bool IsCjk(char32_t cp) {
  return (cp >= 0x3000 && cp <= 0x30FF)      // CJK symbols and punctuation, Hiragana, Katakana
         || (cp >= 0x3400 && cp <= 0x4DBF)   // CJK unified ideographs extension A
         || (cp >= 0x4E00 && cp <= 0x9FFF)   // CJK unified ideographs
         || (cp >= 0xAC00 && cp <= 0xD7AF)   // Hangul syllables
         || (cp >= 0xF900 && cp <= 0xFAFF)   // CJK compatibility ideographs
         || (cp >= 0xFF00 && cp <= 0xFFEF)   // half width and full width forms
         || (cp >= 0x20000 && cp <= 0x2FA1F);  // supplementary ideographic plane
}

}  // namespace

bool IsValid(std::string_view data) noexcept {
  return ForEachCodepoint(data, [](char32_t) {});
}

std::size_t CountNonAscii(std::string_view data) noexcept {
  std::size_t count = 0;
  ForEachCodepoint(data, [&count](char32_t cp) { count += cp > 0x7F ? 1U : 0U; });
  return count;
}

std::size_t CountCjk(std::string_view data) noexcept {
  std::size_t count = 0;
  ForEachCodepoint(data, [&count](char32_t cp) { count += IsCjk(cp) ? 1U : 0U; });
  return count;
}

std::string FromLatin1(std::string_view data) {
  std::string out;
  out.reserve(data.size() * 2U);
  for (char ch : data) {
    const auto byte = static_cast<uint8_t>(ch);
    if (byte <= 0x7F) {
      out.push_back(ch);
    } else {
      out.push_back(static_cast<char>(0xC0U | (byte >> 6U)));
      out.push_back(static_cast<char>(0x80U | (byte & 0x3FU)));
    }
  }
  return out;
}

std::optional<std::string> ToLatin1(std::string_view data) {
  std::string out;
  out.reserve(data.size());
  bool fits = true;
  const bool valid = ForEachCodepoint(data, [&out, &fits](char32_t cp) {
    if (cp > 0xFF) {
      fits = false;
    } else {
      out.push_back(static_cast<char>(static_cast<uint8_t>(cp)));
    }
  });
  if (!valid || !fits) {
    return std::nullopt;
  }
  return out;
}

namespace {

class IconvDescriptor {
 public:
  IconvDescriptor(const char* toCode, const char* fromCode) noexcept : _cd(::iconv_open(toCode, fromCode)) {}

  IconvDescriptor(const IconvDescriptor&) = delete;
  IconvDescriptor& operator=(const IconvDescriptor&) = delete;

  ~IconvDescriptor() {
    if (*this) {
      ::iconv_close(_cd);
    }
  }

  explicit operator bool() const noexcept { return _cd != reinterpret_cast<iconv_t>(-1); }

  [[nodiscard]] iconv_t get() const noexcept { return _cd; }

 private:
  iconv_t _cd;
};

}  // namespace

TranscodeResult FromCharset(std::string_view charset, std::string_view data) {
  TranscodeResult result;
  const std::string fromCode(charset);
  const IconvDescriptor cd("UTF-8", fromCode.c_str());
  if (!cd) {
    result.status = TranscodeResult::Status::UnknownCharset;
    return result;
  }

  std::string& out = result.text;
  out.resize((data.size() * 4U) + 16U);
  // iconv does not modify the input, its prototype predates const correctness.
  char* inPtr = const_cast<char*>(data.data());
  std::size_t inLeft = data.size();
  std::size_t outPos = 0;

  bool flushed = false;
  while (!flushed) {
    char* outPtr = out.data() + outPos;
    std::size_t outLeft = out.size() - outPos;
    // Once all the input is converted, a null input flushes the shift state.
    const bool flushing = inLeft == 0;
    const std::size_t rc = flushing ? ::iconv(cd.get(), nullptr, nullptr, &outPtr, &outLeft)
                                    : ::iconv(cd.get(), &inPtr, &inLeft, &outPtr, &outLeft);
    const int err = errno;
    outPos = static_cast<std::size_t>(outPtr - out.data());
    if (rc != static_cast<std::size_t>(-1)) {
      flushed = flushing;
    } else if (err == E2BIG) {
      out.resize(out.size() * 2U);
    } else {
      // EILSEQ, or EINVAL for a truncated multibyte sequence
      result.status = TranscodeResult::Status::InvalidInput;
      out.clear();
      return result;
    }
  }
  out.resize(outPos);
  return result;
}

}  // namespace ferry::utf8
