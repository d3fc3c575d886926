#pragma once

#include <string_view>

#include "ferry/http-status-code.hpp"

namespace ferry::http {

// Header field names are case-insensitive. They are stored here in their canonical form for emission,
// lookups in parsing code compare them case-insensitively.

inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";

inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentDisposition = "Content-Disposition";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Connection = "Connection";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";
inline constexpr std::string_view ContentTypeMultipartFormData = "multipart/form-data";

constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return "OK";
    case StatusCodeFound:
      return "Found";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeUnsupportedMediaType:
      return "Unsupported Media Type";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    default:
      return {};
  }
}

}  // namespace ferry::http
