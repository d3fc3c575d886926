#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ferry {

// RFC 2046: boundary values are 1 to 70 characters long.
inline constexpr std::size_t kMaxBoundaryLength = 70;

// Boundary parameter of a 'multipart/form-data' Content-Type header value (quotes stripped,
// case-insensitive media type and parameter name).
// Returns an empty string_view if the media type is not multipart/form-data, or if the boundary parameter is
// missing, empty or longer than kMaxBoundaryLength.
[[nodiscard]] std::string_view ExtractBoundary(std::string_view contentType);

// Delimiter token searched in the body: "--" followed by the boundary value.
[[nodiscard]] std::string MakeBoundaryToken(std::string_view boundary);

}  // namespace ferry
