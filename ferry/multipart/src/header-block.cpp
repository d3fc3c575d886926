#include "ferry/header-block.hpp"

#include <algorithm>
#include <cstddef>
#include <span>
#include <string_view>

#include "ferry/ascii.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/log.hpp"
#include "ferry/vector.hpp"

namespace ferry {

HeaderBlockEnd FindHeaderBlockEnd(std::string_view buffer) noexcept {
  if (buffer.starts_with(http::CRLF)) {
    return {0, http::CRLF.size()};
  }
  const auto pos = buffer.find(http::DoubleCRLF);
  if (pos == std::string_view::npos) {
    return {};
  }
  return {pos, http::DoubleCRLF.size()};
}

std::string_view ParseHeaderBlock(std::string_view block, vector<PartHeaderView>& headers) {
  while (!block.empty()) {
    const auto lineEnd = block.find(http::CRLF);
    std::string_view line;
    if (lineEnd == std::string_view::npos) {
      line = block;
      block = {};
    } else {
      line = block.substr(0, lineEnd);
      block.remove_prefix(lineEnd + http::CRLF.size());
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    const auto name = colon == std::string_view::npos ? std::string_view{} : TrimOws(line.substr(0, colon));
    if (name.empty()) {
      // The part name and filename come from Content-Disposition only, other broken lines (obs-fold...) are dropped
      if (StartsWithCaseInsensitive(TrimOws(line), http::ContentDisposition)) {
        return "multipart part Content-Disposition header is malformed";
      }
      log::debug("Ignoring unparseable part header line of {} bytes", line.size());
      continue;
    }
    headers.push_back(PartHeaderView{name, TrimOws(line.substr(colon + 1))});
  }
  return {};
}

std::string_view HeaderValueOrEmpty(std::span<const PartHeaderView> headers, std::string_view name) noexcept {
  const auto it = std::ranges::find_if(
      headers, [name](const PartHeaderView& header) { return CaseInsensitiveEqual(header.name, name); });
  return it == headers.end() ? std::string_view{} : it->value;
}

}  // namespace ferry
