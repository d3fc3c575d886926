#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "ferry/header-block.hpp"

namespace ferry {

// Extracts the filename of an uploaded part from its headers.
class FilenameDecoder {
 public:
  FilenameDecoder() noexcept = default;

  FilenameDecoder(const FilenameDecoder&) = delete;
  FilenameDecoder& operator=(const FilenameDecoder&) = delete;

  virtual ~FilenameDecoder() = default;

  // Decoded (UTF-8) filename of the part whose headers are 'headers', before any path sanitization.
  // Returns std::nullopt for parts without Content-Disposition header or without (non-empty) filename, which are
  // plain form fields.
  [[nodiscard]] virtual std::optional<std::string> decode(std::span<const PartHeaderView> headers) const = 0;

 protected:
  FilenameDecoder(FilenameDecoder&&) noexcept = default;
  FilenameDecoder& operator=(FilenameDecoder&&) noexcept = default;
};

// Best-effort recovery of filenames sent by inconsistent clients:
//  1. an RFC 5987 'filename*' parameter wins when it decodes. Charsets other than UTF-8, ISO-8859-1 and US-ASCII
//     (GBK, Shift_JIS, windows-1252...) are transcoded with iconv(3), charsets iconv does not know are read as UTF-8.
//  2. a plain 'filename' containing '%' is percent-decoded ('+' is kept as is) when that changes it.
//  3. otherwise, UTF-8 text that was read as Latin-1 and re-encoded to UTF-8 by the client is reverted, but only when
//     the reverted text has more CJK characters than the original.
//  4. bytes that are not valid UTF-8 are taken as Latin-1.
// A 'filename*' that cannot be decoded and comes without a plain 'filename' is still a file name: its percent-decoded
// bytes are read as UTF-8, or as Latin-1 when they are not valid UTF-8.
// This is a compatibility heuristic, not a protocol guarantee. StrictFilenameDecoder is the standard alternative.
class LenientFilenameDecoder final : public FilenameDecoder {
 public:
  [[nodiscard]] std::optional<std::string> decode(std::span<const PartHeaderView> headers) const override;
};

// RFC 6266 decoding: 'filename*' is preferred (any charset known to iconv(3)), the plain 'filename' is taken literally
// (as ISO-8859-1 when it is not valid UTF-8). As for LenientFilenameDecoder, an undecodable 'filename*' alone still
// names a file.
class StrictFilenameDecoder final : public FilenameDecoder {
 public:
  [[nodiscard]] std::optional<std::string> decode(std::span<const PartHeaderView> headers) const override;
};

// Decode an RFC 5987 ext-value (charset'language'percent-encoded-value) into UTF-8.
// Charsets other than UTF-8, ISO-8859-1 and US-ASCII are transcoded with iconv(3).
// When 'lenient' is true, a value without the charset'language' prefix is read as percent-encoded UTF-8 and charsets
// unknown to iconv are read as UTF-8. Returns std::nullopt when the value cannot be decoded.
[[nodiscard]] std::optional<std::string> DecodeExtValue(std::string_view extValue, bool lenient);

// Final path segment of 'filename' (both '/' and '\' are separators), usable as a file name directly under the
// storage root. Returns an empty string_view if there is no such segment ("", ".", "..", trailing separator) or if
// the name contains a NUL byte.
[[nodiscard]] std::string_view SanitizeLeafName(std::string_view filename) noexcept;

}  // namespace ferry
