#include "ferry/boundary.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "ferry/ascii.hpp"
#include "ferry/http-constants.hpp"

namespace ferry {

std::string_view ExtractBoundary(std::string_view contentType) {
  if (contentType.empty()) {
    return {};
  }

  const auto semicolon = contentType.find(';');
  const auto typeToken = semicolon == std::string_view::npos ? contentType : contentType.substr(0, semicolon);
  if (!CaseInsensitiveEqual(TrimOws(typeToken), http::ContentTypeMultipartFormData) ||
      semicolon == std::string_view::npos) {
    return {};
  }

  auto params = contentType.substr(semicolon + 1);
  while (!params.empty()) {
    const auto next = params.find(';');
    const auto chunk = next == std::string_view::npos ? params : params.substr(0, next);
    const auto eq = chunk.find('=');
    if (eq != std::string_view::npos && CaseInsensitiveEqual(TrimOws(chunk.substr(0, eq)), "boundary")) {
      const auto value = StripQuotes(TrimOws(chunk.substr(eq + 1)));
      if (value.size() > kMaxBoundaryLength) {
        return {};
      }
      return value;
    }
    if (next == std::string_view::npos) {
      break;
    }
    params.remove_prefix(next + 1);
  }
  return {};
}

std::string MakeBoundaryToken(std::string_view boundary) {
  std::string token;
  token.reserve(boundary.size() + 2U);
  token.append("--").append(boundary);
  return token;
}

}  // namespace ferry
