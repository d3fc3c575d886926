// Parse a multipart/form-data body read from standard input and store its files in a directory.
//
//   ferry-ingest 'multipart/form-data; boundary=XyZ' ./storage < body.bin
#include <unistd.h>

#include <ferry/ferry.hpp>
#include <exception>
#include <iostream>
#include <string_view>
#include <utility>

// Must precede the sink header: it selects the header-only spdlog build.
#include "ferry/log.hpp"
// clang-format off
#include <spdlog/sinks/stdout_color_sinks.h>
// clang-format on

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <content-type> [storage-dir]\n";
    return 2;
  }
  // Keep standard output for the report.
  ferry::log::set_default_logger(ferry::log::stderr_color_mt("ferry"));

  try {
    ferry::TransferServiceConfig config;
    config.withNbWorkerThreads(1);
    if (argc > 2) {
      config.storage.withDirectory(argv[2]);
    }
    config.upload.withProgressIntervalBytes(1UL << 20);
    ferry::TransferService service(std::move(config));

    ferry::FdByteSource body(STDIN_FILENO);
    const ferry::UploadOutcome outcome =
        service.handleUpload(ferry::http::POST, argv[1], body, [](const ferry::ProgressSample& sample) {
          std::cout << sample.identifier << ": " << sample.bytesTransferred << " bytes";
          if (sample.totalBytes) {
            std::cout << " (done)";
          }
          std::cout << '\n';
        });

    for (const ferry::SavedPart& part : outcome.result.savedParts) {
      std::cout << (part.complete ? "saved " : "partial ") << part.path.string() << " (" << part.sizeBytes
                << " bytes)\n";
    }
    std::cout << "status " << outcome.response.status() << ", state "
              << ferry::MultipartStateName(outcome.result.state) << '\n';
    if (!outcome.result.ok()) {
      std::cerr << ferry::TransferErrorName(outcome.result.error) << ": " << outcome.result.reason << '\n';
      return 1;
    }
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
