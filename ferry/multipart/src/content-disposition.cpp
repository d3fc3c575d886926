#include "ferry/content-disposition.hpp"

#include <cstddef>
#include <string_view>

#include "ferry/ascii.hpp"

namespace ferry {

namespace {

// Position of the next ';' outside of a quoted string, or npos.
std::size_t FindParamSeparator(std::string_view value) noexcept {
  bool inQuotes = false;
  for (std::size_t pos = 0; pos < value.size(); ++pos) {
    const char ch = value[pos];
    if (ch == '"') {
      inQuotes = !inQuotes;
    } else if (ch == '\\' && inQuotes) {
      ++pos;
    } else if (ch == ';' && !inQuotes) {
      return pos;
    }
  }
  return std::string_view::npos;
}

}  // namespace

ContentDispositionParams ParseContentDisposition(std::string_view headerValue) noexcept {
  ContentDispositionParams ret;
  bool firstToken = true;
  while (!headerValue.empty()) {
    const auto sep = FindParamSeparator(headerValue);
    const auto token = TrimOws(sep == std::string_view::npos ? headerValue : headerValue.substr(0, sep));
    if (firstToken) {
      ret.type = token;
      firstToken = false;
    } else if (const auto eq = token.find('='); eq != std::string_view::npos) {
      const auto key = TrimOws(token.substr(0, eq));
      const auto value = StripQuotes(TrimOws(token.substr(eq + 1)));
      if (CaseInsensitiveEqual(key, "name")) {
        ret.name = value;
      } else if (CaseInsensitiveEqual(key, "filename")) {
        ret.filename = value;
      } else if (CaseInsensitiveEqual(key, "filename*")) {
        ret.filenameExt = value;
      }
    }
    if (sep == std::string_view::npos) {
      break;
    }
    headerValue.remove_prefix(sep + 1);
  }
  return ret;
}

}  // namespace ferry
