#include "ferry/transfer-service-config.hpp"

#include <stdexcept>

namespace ferry {

void TransferServiceConfig::validate() const {
  upload.validate();
  delivery.validate();
  storage.validate();
  if (nbWorkerThreads == 0) {
    throw std::invalid_argument("TransferServiceConfig.nbWorkerThreads must be > 0");
  }
  if (maxQueuedJobs == 0) {
    throw std::invalid_argument("TransferServiceConfig.maxQueuedJobs must be > 0");
  }
}

}  // namespace ferry
