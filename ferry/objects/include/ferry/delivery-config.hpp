#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

#include "ferry/http-constants.hpp"

namespace ferry {

// Configuration of the zero-copy file delivery path.
struct DeliveryConfig {
  void validate() const;

  DeliveryConfig& withSendfileChunkSize(std::size_t value) {
    sendfileChunkSize = value;
    return *this;
  }

  DeliveryConfig& withDefaultContentType(std::string_view value) {
    defaultContentType = value;
    return *this;
  }

  DeliveryConfig& withDownloadPathPrefix(std::string_view value) {
    downloadPathPrefix = value;
    return *this;
  }

  DeliveryConfig& withIoTimeout(std::chrono::milliseconds value) {
    ioTimeout = value;
    return *this;
  }

  // Maximum number of bytes handed to a single sendfile(2) call.
  std::size_t sendfileChunkSize{64UL * 1024UL};

  // Content type used when probing a file yields nothing.
  std::string defaultContentType{http::ContentTypeApplicationOctetStream};

  // Request target prefix under which stored files are served. Must start and end with '/'.
  std::string downloadPathPrefix{"/files/"};

  // Maximum time to wait for the client socket to become writable again.
  std::chrono::milliseconds ioTimeout{std::chrono::seconds{30}};
};

}  // namespace ferry
