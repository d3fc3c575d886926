#include "ferry/delivery-config.hpp"

#include <stdexcept>

namespace ferry {

void DeliveryConfig::validate() const {
  if (sendfileChunkSize == 0) {
    throw std::invalid_argument("DeliveryConfig.sendfileChunkSize must be > 0");
  }
  if (defaultContentType.empty()) {
    throw std::invalid_argument("DeliveryConfig.defaultContentType cannot be empty");
  }
  if (downloadPathPrefix.empty() || downloadPathPrefix.front() != '/' || downloadPathPrefix.back() != '/') {
    throw std::invalid_argument("DeliveryConfig.downloadPathPrefix must start and end with '/'");
  }
  if (ioTimeout.count() <= 0) {
    throw std::invalid_argument("DeliveryConfig.ioTimeout must be > 0");
  }
}

}  // namespace ferry
