#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "ferry/http-status-code.hpp"
#include "ferry/vector.hpp"

namespace ferry {

// Status line, headers and optional small inline body of a response emitted by the transfer service.
// File bodies are never held here: they are streamed separately after the head.
class TransferResponse {
 public:
  struct Header {
    std::string name;
    std::string value;
  };

  explicit TransferResponse(http::StatusCode status = http::StatusCodeOK) noexcept : _status(status) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  TransferResponse& status(http::StatusCode status) noexcept {
    _status = status;
    return *this;
  }

  // Appends a header. Names are not deduplicated.
  TransferResponse& header(std::string_view name, std::string_view value);

  // Sets the inline body. Content-Length is derived from it at serialization unless set explicitly.
  TransferResponse& body(std::string_view body);

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Value of the first header named 'name' (case-insensitive), or empty.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept;

  [[nodiscard]] bool hasHeader(std::string_view name) const noexcept;

  [[nodiscard]] const vector<Header>& headers() const noexcept { return _headers; }

  // Status line, headers and the blank line terminating them.
  [[nodiscard]] std::string head() const;

  // head() followed by the inline body.
  [[nodiscard]] std::string serialize() const;

 private:
  vector<Header> _headers;
  std::string _body;
  http::StatusCode _status;
};

}  // namespace ferry
