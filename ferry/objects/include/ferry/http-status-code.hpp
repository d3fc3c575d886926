#pragma once

#include <cstdint>

namespace ferry::http {

using StatusCode = int16_t;

inline constexpr StatusCode StatusCodeOK = 200;

inline constexpr StatusCode StatusCodeFound = 302;

inline constexpr StatusCode StatusCodeBadRequest = 400;
inline constexpr StatusCode StatusCodeForbidden = 403;
inline constexpr StatusCode StatusCodeNotFound = 404;
inline constexpr StatusCode StatusCodeMethodNotAllowed = 405;
inline constexpr StatusCode StatusCodeUnsupportedMediaType = 415;

inline constexpr StatusCode StatusCodeInternalServerError = 500;
inline constexpr StatusCode StatusCodeServiceUnavailable = 503;

}  // namespace ferry::http
