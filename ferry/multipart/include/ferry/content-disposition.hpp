#pragma once

#include <optional>
#include <string_view>

namespace ferry {

// Views over the parameters of a Content-Disposition header value that matter for uploads.
// Parameter values are unquoted (a ';' inside a quoted string does not split parameters), but not decoded.
struct ContentDispositionParams {
  std::string_view type;
  std::string_view name;
  // Plain 'filename' parameter.
  std::optional<std::string_view> filename;
  // Extended 'filename*' parameter (RFC 5987 charset'language'value form).
  std::optional<std::string_view> filenameExt;
};

[[nodiscard]] ContentDispositionParams ParseContentDisposition(std::string_view headerValue) noexcept;

}  // namespace ferry
