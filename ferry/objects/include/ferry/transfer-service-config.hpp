#pragma once

#include <cstdint>
#include <utility>

#include "ferry/delivery-config.hpp"
#include "ferry/storage-config.hpp"
#include "ferry/upload-config.hpp"

namespace ferry {

struct TransferServiceConfig {
  // Checks this configuration and all of its sub-configurations. Throws std::invalid_argument.
  void validate() const;

  TransferServiceConfig& withUploadConfig(UploadConfig value) {
    upload = value;
    return *this;
  }

  TransferServiceConfig& withDeliveryConfig(DeliveryConfig value) {
    delivery = std::move(value);
    return *this;
  }

  TransferServiceConfig& withStorageConfig(StorageConfig value) {
    storage = std::move(value);
    return *this;
  }

  TransferServiceConfig& withNbWorkerThreads(uint32_t value) {
    nbWorkerThreads = value;
    return *this;
  }

  TransferServiceConfig& withMaxQueuedJobs(uint32_t value) {
    maxQueuedJobs = value;
    return *this;
  }

  UploadConfig upload;
  DeliveryConfig delivery;
  StorageConfig storage;

  // Number of threads of the worker pool handling requests.
  uint32_t nbWorkerThreads{4};

  // Maximum number of requests waiting for a worker. Further posts are refused.
  uint32_t maxQueuedJobs{64};
};

}  // namespace ferry
