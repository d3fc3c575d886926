#include "ferry/filename-decoder.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "ferry/ascii.hpp"
#include "ferry/content-disposition.hpp"
#include "ferry/header-block.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/log.hpp"
#include "ferry/percent-codec.hpp"
#include "ferry/utf8.hpp"

namespace ferry {

namespace {

enum class Charset : uint8_t { Utf8, Latin1, Ascii, Unknown };

Charset CharsetFromName(std::string_view name) {
  if (name.empty() || CaseInsensitiveEqual(name, "utf-8") || CaseInsensitiveEqual(name, "utf8")) {
    return Charset::Utf8;
  }
  if (CaseInsensitiveEqual(name, "iso-8859-1") || CaseInsensitiveEqual(name, "latin1") ||
      CaseInsensitiveEqual(name, "iso_8859-1")) {
    return Charset::Latin1;
  }
  if (CaseInsensitiveEqual(name, "us-ascii") || CaseInsensitiveEqual(name, "ascii")) {
    return Charset::Ascii;
  }
  return Charset::Unknown;
}

std::optional<ContentDispositionParams> FindContentDisposition(std::span<const PartHeaderView> headers) {
  const auto value = HeaderValueOrEmpty(headers, http::ContentDisposition);
  if (value.empty()) {
    return std::nullopt;
  }
  return ParseContentDisposition(value);
}

std::string ToUtf8(std::string_view raw) { return utf8::IsValid(raw) ? std::string(raw) : utf8::FromLatin1(raw); }

std::optional<std::string> NonEmpty(std::optional<std::string> value) {
  if (value && value->empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<std::string> DecodeExtValue(std::string_view extValue, bool lenient) {
  std::string_view charsetName;
  std::string_view encoded = extValue;
  const auto firstTick = extValue.find('\'');
  const auto secondTick = firstTick == std::string_view::npos ? firstTick : extValue.find('\'', firstTick + 1);
  if (secondTick != std::string_view::npos) {
    charsetName = extValue.substr(0, firstTick);
    encoded = extValue.substr(secondTick + 1);
  } else if (!lenient) {
    return std::nullopt;
  }

  auto decoded = PercentDecode(encoded);
  if (!decoded) {
    return std::nullopt;
  }
  switch (CharsetFromName(charsetName)) {
    case Charset::Utf8:
      if (!utf8::IsValid(*decoded)) {
        return std::nullopt;
      }
      return decoded;
    case Charset::Latin1:
      return utf8::FromLatin1(*decoded);
    case Charset::Ascii:
      if (utf8::CountNonAscii(*decoded) != 0 || !utf8::IsValid(*decoded)) {
        return std::nullopt;
      }
      return decoded;
    default: {
      auto transcoded = utf8::FromCharset(charsetName, *decoded);
      if (transcoded.status == utf8::TranscodeResult::Status::Ok) {
        return std::move(transcoded.text);
      }
      if (transcoded.status == utf8::TranscodeResult::Status::UnknownCharset && lenient &&
          utf8::IsValid(*decoded)) {
        return decoded;
      }
      log::debug("Unable to decode filename* value in charset '{}'", charsetName);
      return std::nullopt;
    }
  }
}

namespace {

// A part carrying a filename* parameter stays a file part even when the value cannot be decoded in its declared
// charset: its bytes are then kept, read as UTF-8 or else as Latin-1.
std::optional<std::string> ExtValueFallback(std::optional<std::string_view> extValue) {
  if (!extValue) {
    return std::nullopt;
  }
  const auto firstTick = extValue->find('\'');
  const auto secondTick = firstTick == std::string_view::npos ? firstTick : extValue->find('\'', firstTick + 1);
  const std::string_view encoded = secondTick == std::string_view::npos ? *extValue : extValue->substr(secondTick + 1);
  const auto decoded = PercentDecode(encoded);
  return NonEmpty(ToUtf8(decoded ? std::string_view(*decoded) : encoded));
}

}  // namespace

std::optional<std::string> LenientFilenameDecoder::decode(std::span<const PartHeaderView> headers) const {
  const auto params = FindContentDisposition(headers);
  if (!params) {
    return std::nullopt;
  }
  if (params->filenameExt) {
    if (auto decoded = NonEmpty(DecodeExtValue(*params->filenameExt, true))) {
      return decoded;
    }
    log::debug("Unable to decode filename* '{}', trying plain filename", *params->filenameExt);
  }
  if (!params->filename || params->filename->empty()) {
    return ExtValueFallback(params->filenameExt);
  }

  const std::string_view raw = *params->filename;
  if (raw.contains('%')) {
    auto decoded = PercentDecode(raw);
    if (decoded && *decoded != raw && !decoded->empty() && utf8::IsValid(*decoded)) {
      return decoded;
    }
  }

  if (!utf8::IsValid(raw)) {
    return utf8::FromLatin1(raw);
  }

  if (utf8::CountNonAscii(raw) != 0) {
    auto reverted = utf8::ToLatin1(raw);
    if (reverted && utf8::IsValid(*reverted) && utf8::CountCjk(*reverted) > utf8::CountCjk(raw)) {
      log::debug("Recovered mis-encoded filename '{}' as '{}'", raw, *reverted);
      return reverted;
    }
  }
  return std::string(raw);
}

std::optional<std::string> StrictFilenameDecoder::decode(std::span<const PartHeaderView> headers) const {
  const auto params = FindContentDisposition(headers);
  if (!params) {
    return std::nullopt;
  }
  if (params->filenameExt) {
    if (auto decoded = NonEmpty(DecodeExtValue(*params->filenameExt, false))) {
      return decoded;
    }
  }
  if (!params->filename || params->filename->empty()) {
    return ExtValueFallback(params->filenameExt);
  }
  return ToUtf8(*params->filename);
}

std::string_view SanitizeLeafName(std::string_view filename) noexcept {
  const auto lastSep = filename.find_last_of("/\\");
  if (lastSep != std::string_view::npos) {
    filename.remove_prefix(lastSep + 1);
  }
  if (filename.empty() || filename == "." || filename == ".." || filename.contains('\0')) {
    return {};
  }
  return filename;
}

}  // namespace ferry
