// Write the HTTP response serving a stored file to standard output, the body being sent with sendfile(2).
//
//   ferry-serve-file ./storage 'report%20final.pdf' > response.bin
#include <unistd.h>

#include <ferry/ferry.hpp>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

// Must precede the sink header: it selects the header-only spdlog build.
#include "ferry/log.hpp"
// clang-format off
#include <spdlog/sinks/stdout_color_sinks.h>
// clang-format on

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: " << argv[0] << " <storage-dir> <percent-encoded-name> [GET|HEAD]\n";
    return 2;
  }
  ferry::log::set_default_logger(ferry::log::stderr_color_mt("ferry"));

  try {
    ferry::TransferServiceConfig config;
    config.storage.withDirectory(argv[1]).withCreateIfMissing(false);
    config.withNbWorkerThreads(1);
    ferry::TransferService service(std::move(config));

    const std::string target = service.config().delivery.downloadPathPrefix + argv[2];
    const std::string_view method = argc > 3 ? std::string_view(argv[3]) : ferry::http::GET;
    const ferry::DeliveryResult result = service.handleDownload(method, target, STDOUT_FILENO);

    std::cerr << "status " << result.status << ", " << result.bodyBytesSent << " body bytes sent\n";
    if (!result.complete() || result.status != ferry::http::StatusCodeOK) {
      return 1;
    }
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << '\n';
    return 1;
  }
  return 0;
}
