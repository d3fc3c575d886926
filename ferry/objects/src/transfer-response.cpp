#include "ferry/transfer-response.hpp"

#include <cstddef>
#include <format>
#include <iterator>
#include <string>
#include <string_view>

#include "ferry/ascii.hpp"
#include "ferry/http-constants.hpp"

namespace ferry {

TransferResponse& TransferResponse::header(std::string_view name, std::string_view value) {
  _headers.push_back(Header{std::string(name), std::string(value)});
  return *this;
}

TransferResponse& TransferResponse::body(std::string_view body) {
  _body.assign(body);
  return *this;
}

std::string_view TransferResponse::headerValueOrEmpty(std::string_view name) const noexcept {
  for (const Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return header.value;
    }
  }
  return {};
}

bool TransferResponse::hasHeader(std::string_view name) const noexcept {
  for (const Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return true;
    }
  }
  return false;
}

std::string TransferResponse::head() const {
  std::string out;
  out.reserve(64UL + (_headers.size() * 48UL));
  std::format_to(std::back_inserter(out), "{} {} {}{}", http::HTTP11Sv, _status, http::ReasonPhraseFor(_status),
                 http::CRLF);
  for (const Header& header : _headers) {
    out.append(header.name);
    out.append(http::HeaderSep);
    out.append(header.value);
    out.append(http::CRLF);
  }
  if (!hasHeader(http::ContentLength)) {
    std::format_to(std::back_inserter(out), "{}{}{}{}", http::ContentLength, http::HeaderSep, _body.size(),
                   http::CRLF);
  }
  out.append(http::CRLF);
  return out;
}

std::string TransferResponse::serialize() const {
  std::string out = head();
  out.append(_body);
  return out;
}

}  // namespace ferry
