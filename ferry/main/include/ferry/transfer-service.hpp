#pragma once

#include <memory>
#include <string_view>
#include <utility>

#include "ferry/byte-source.hpp"
#include "ferry/content-type-cache.hpp"
#include "ferry/file-delivery.hpp"
#include "ferry/filename-decoder.hpp"
#include "ferry/multipart-stream-controller.hpp"
#include "ferry/progress.hpp"
#include "ferry/storage-root.hpp"
#include "ferry/transfer-response.hpp"
#include "ferry/transfer-service-config.hpp"
#include "ferry/vector.hpp"
#include "ferry/worker-pool.hpp"

namespace ferry {

struct UploadOutcome {
  // Response to send back: 302 to the index on success, an error status with a short text body otherwise.
  TransferResponse response;
  UploadResult result;
};

// Owns every component shared by the requests of one file transfer endpoint: the storage root, the filename decoder,
// the content type cache, the delivery path and the worker pool running the requests.
// Listening sockets and routing belong to the caller, which hands request method, target, headers and body here.
//
// Handlers may be called concurrently from any thread.
class TransferService {
 public:
  // Validates 'config' (std::invalid_argument) and opens the storage directory, resolving the default one when
  // config.storage.directory is empty.
  explicit TransferService(TransferServiceConfig config);

  TransferService(const TransferService &) = delete;
  TransferService(TransferService &&) = delete;
  TransferService &operator=(const TransferService &) = delete;
  TransferService &operator=(TransferService &&) = delete;

  ~TransferService();

  // Ingest a multipart/form-data request body.
  //   - 405 if 'method' is not POST
  //   - 415 if 'contentType' is not multipart/form-data, 400 if its boundary parameter is missing or invalid
  //   - 400 for malformed or truncated bodies, 403 for rejected filenames, 500 for storage failures
  //   - 302 to "/" once every part has been processed
  [[nodiscard]] UploadOutcome handleUpload(std::string_view method, std::string_view contentType, ByteSource &body,
                                           ProgressCallback progress = {}) const;

  // Serve the stored file designated by the request 'target' (DeliveryConfig::downloadPathPrefix followed by the
  // percent-encoded relative path) to 'outFd'. Error responses are written to 'outFd' as well.
  // The target is a URI path, not a form query: '+' stays a literal '+', links must encode spaces as %20.
  //   - 405 if 'method' is neither GET nor HEAD (HEAD sends the head only)
  //   - 404 for targets outside of the download prefix, missing files and directories
  //   - 400 for invalid percent-encoding, 403 for paths escaping the storage root
  [[nodiscard]] DeliveryResult handleDownload(std::string_view method, std::string_view target, int outFd) const;

  // Run 'job' on the worker pool. Returns false if the queue is full or the service is shut down.
  [[nodiscard]] bool post(WorkerPool::Job job) { return _pool.tryPost(std::move(job)); }

  // Stored files, sorted by name in descending order.
  [[nodiscard]] vector<StorageRoot::Entry> list() const { return _storage.list(); }

  // Finish queued jobs and stop the workers. Handlers keep working synchronously afterwards.
  void shutdown() { _pool.shutdown(); }

  [[nodiscard]] const TransferServiceConfig &config() const noexcept { return _config; }

  [[nodiscard]] const StorageRoot &storage() const noexcept { return _storage; }

  [[nodiscard]] ContentTypeCache &contentTypes() noexcept { return _contentTypes; }

  [[nodiscard]] const WorkerPool &workerPool() const noexcept { return _pool; }

 private:
  DeliveryResult sendError(int outFd, http::StatusCode status, bool withBody) const;

  TransferServiceConfig _config;
  StorageRoot _storage;
  std::unique_ptr<FilenameDecoder> _decoder;
  ContentTypeCache _contentTypes;
  FileDelivery _delivery;
  WorkerPool _pool;
};

}  // namespace ferry
