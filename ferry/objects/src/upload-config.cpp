#include "ferry/upload-config.hpp"

#include <stdexcept>

namespace ferry {

void UploadConfig::validate() const {
  if (bufferSize < kMinBufferSize) {
    throw std::invalid_argument("UploadConfig.bufferSize must be at least 4 KiB");
  }
  if (maxHeaderBlockBytes == 0) {
    throw std::invalid_argument("UploadConfig.maxHeaderBlockBytes must be > 0");
  }
  if (maxHeaderBlockBytes > bufferSize) {
    throw std::invalid_argument("UploadConfig.maxHeaderBlockBytes must not exceed bufferSize");
  }
}

}  // namespace ferry
