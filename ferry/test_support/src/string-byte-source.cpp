#include "ferry/string-byte-source.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace ferry::test {

StringByteSource::StringByteSource(std::string content, std::size_t chunkSize, std::size_t failAfter)
    : _content(std::move(content)), _chunkSize(std::max<std::size_t>(chunkSize, 1U)), _failAfter(failAfter) {}

ReadResult StringByteSource::read(std::span<char> dst) {
  ++_nbReads;
  if (_pos >= _failAfter) {
    return {0, ReadResult::Status::Error};
  }
  std::size_t nbBytes = std::min({dst.size(), _chunkSize, _content.size() - _pos});
  if (_failAfter != kNoFailure) {
    nbBytes = std::min(nbBytes, _failAfter - _pos);
  }
  if (nbBytes == 0) {
    return {};
  }
  std::memcpy(dst.data(), _content.data() + _pos, nbBytes);
  _pos += nbBytes;
  return {nbBytes, ReadResult::Status::Data};
}

MultipartBodyBuilder& MultipartBodyBuilder::preamble(std::string_view text) {
  _body.append(text);
  return *this;
}

MultipartBodyBuilder& MultipartBodyBuilder::filePart(std::string_view fieldName, std::string_view filenameParam,
                                                     std::string_view payload, std::string_view contentType) {
  std::string headers = "Content-Disposition: form-data; name=\"";
  headers.append(fieldName).append("\"; ").append(filenameParam).append("\r\nContent-Type: ").append(contentType);
  return rawPart(headers, payload);
}

MultipartBodyBuilder& MultipartBodyBuilder::fieldPart(std::string_view fieldName, std::string_view value) {
  std::string headers = "Content-Disposition: form-data; name=\"";
  headers.append(fieldName).append("\"");
  return rawPart(headers, value);
}

MultipartBodyBuilder& MultipartBodyBuilder::rawPart(std::string_view headers, std::string_view payload) {
  _body.append("--").append(_boundary).append("\r\n");
  _body.append(headers).append("\r\n\r\n");
  _body.append(payload).append("\r\n");
  return *this;
}

std::string MultipartBodyBuilder::build(bool close) const {
  std::string body = _body;
  if (close) {
    body.append("--").append(_boundary).append("--\r\n");
  }
  return body;
}

}  // namespace ferry::test
