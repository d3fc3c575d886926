#include "ferry/file-delivery.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <csignal>
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <thread>

#include "ferry/base-fd.hpp"
#include "ferry/content-type-cache.hpp"
#include "ferry/delivery-config.hpp"
#include "ferry/file-helpers.hpp"
#include "ferry/file.hpp"
#include "ferry/http-constants.hpp"
#include "ferry/http-status-code.hpp"
#include "ferry/sendfile.hpp"
#include "ferry/storage-root.hpp"
#include "ferry/temp-file.hpp"
#include "ferry/transfer-error.hpp"

namespace ferry {

class FileDeliveryTest : public ::testing::Test {
 protected:
  FileDeliveryTest()
      : storage(tmpDir.dirPath() / "storage"),
        cache(std::string(http::ContentTypeApplicationOctetStream)),
        delivery(storage, cache, DeliveryConfig{}.withSendfileChunkSize(1000)) {}

  std::filesystem::path store(std::string_view name, std::string_view content) const {
    return tmpDir.writeFile(std::filesystem::path("storage") / name, content);
  }

  // Run 'deliver' with a regular file as output and return everything written to it.
  std::string deliverToFile(std::string_view relative, DeliveryResult &result, bool withBody = true) {
    const auto outPath = tmpDir.dirPath() / "out.bin";
    {
      File out(outPath, File::OpenMode::WriteTruncate);
      EXPECT_TRUE(out);
      result = delivery.deliver(relative, out.fd(), withBody);
    }
    return test::ReadFileContent(outPath);
  }

  test::ScopedTempDir tmpDir;
  StorageRoot storage;
  ContentTypeCache cache;
  FileDelivery delivery;
};

TEST(AttachmentDisposition, AsciiName) {
  EXPECT_EQ(MakeAttachmentDisposition("report.pdf"), "attachment; filename=\"report.pdf\"; filename*=UTF-8''report.pdf");
}

TEST(AttachmentDisposition, SpecialCharactersAreEscaped) {
  EXPECT_EQ(MakeAttachmentDisposition("my \"q\" file.txt"),
            "attachment; filename=\"my _q_ file.txt\"; filename*=UTF-8''my%20%22q%22%20file.txt");
}

TEST(AttachmentDisposition, NonAsciiNameHasOneFallbackCharPerCodePoint) {
  EXPECT_EQ(MakeAttachmentDisposition("\xE6\x97\xA5\xE6\x9C\xAC.txt"),
            "attachment; filename=\"__.txt\"; filename*=UTF-8''%E6%97%A5%E6%9C%AC.txt");
}

TEST_F(FileDeliveryTest, PrepareBuildsHeaders) {
  store("notes.txt", "some notes");
  PreparedDownload prepared = delivery.prepare("notes.txt");
  ASSERT_TRUE(prepared.ok());
  EXPECT_TRUE(prepared.file);
  EXPECT_EQ(prepared.path.filename(), "notes.txt");
  EXPECT_EQ(prepared.response.status(), http::StatusCodeOK);
  EXPECT_EQ(prepared.response.headerValueOrEmpty("content-type"), "text/plain");
  EXPECT_EQ(prepared.response.headerValueOrEmpty("content-length"), "10");
  EXPECT_EQ(prepared.response.headerValueOrEmpty("content-disposition"),
            "attachment; filename=\"notes.txt\"; filename*=UTF-8''notes.txt");
}

TEST_F(FileDeliveryTest, DeliversHeadThenExactBody) {
  std::string payload;
  for (int line = 0; line < 5000; ++line) {
    payload.append("line ").append(std::to_string(line)).append("\n");
  }
  store("big.log", payload);

  DeliveryResult result;
  const std::string written = deliverToFile("big.log", result);
  EXPECT_TRUE(result.complete());
  EXPECT_EQ(result.status, http::StatusCodeOK);
  EXPECT_EQ(result.error, TransferError::None);
  EXPECT_EQ(result.bodyBytesSent, payload.size());

  const std::string expectedHead = "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: " +
                                   std::to_string(payload.size()) +
                                   "\r\nContent-Disposition: attachment; filename=\"big.log\"; "
                                   "filename*=UTF-8''big.log\r\n\r\n";
  EXPECT_EQ(written, expectedHead + payload);
}

TEST_F(FileDeliveryTest, DeliversOverSocket) {
  const std::string payload(200000, 'z');
  store("data.bin", payload);

  std::array<int, 2> fds{};
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds.data()), 0);
  BaseFd out(fds[0]);
  BaseFd in(fds[1]);

  std::string received;
  std::jthread consumer([&received, fd = in.fd()] { received = test::ReadAllFromFd(fd); });
  const DeliveryResult result = delivery.deliver("data.bin", out.fd());
  out.close();
  consumer.join();

  EXPECT_TRUE(result.complete());
  ASSERT_GE(received.size(), payload.size());
  EXPECT_TRUE(received.starts_with("HTTP/1.1 200 OK\r\nContent-Type: application/octet-stream\r\n"));
  EXPECT_EQ(received.substr(received.size() - payload.size()), payload);
}

TEST_F(FileDeliveryTest, EmptyFile) {
  store("empty.txt", "");
  DeliveryResult result;
  const std::string written = deliverToFile("empty.txt", result);
  EXPECT_TRUE(result.complete());
  EXPECT_EQ(result.bodyBytesSent, 0U);
  EXPECT_TRUE(written.ends_with("Content-Length: 0\r\nContent-Disposition: attachment; filename=\"empty.txt\"; "
                                "filename*=UTF-8''empty.txt\r\n\r\n"));
}

TEST_F(FileDeliveryTest, HeadOnly) {
  store("page.html", "<html></html>");
  DeliveryResult result;
  const std::string written = deliverToFile("page.html", result, false);
  EXPECT_TRUE(result.complete());
  EXPECT_EQ(result.bodyBytesSent, 0U);
  EXPECT_TRUE(written.ends_with("\r\n\r\n"));
  EXPECT_NE(written.find("Content-Length: 13\r\n"), std::string::npos);
  EXPECT_EQ(written.find("<html>"), std::string::npos);
}

TEST_F(FileDeliveryTest, ContentTypeIsProbedOnce) {
  store("a.json", "{}");
  DeliveryResult result;
  deliverToFile("a.json", result);
  deliverToFile("a.json", result);
  EXPECT_TRUE(result.complete());
  EXPECT_EQ(cache.nbProbes(), 1U);
}

TEST_F(FileDeliveryTest, MissingFileIsNotFound) {
  DeliveryResult result;
  const std::string written = deliverToFile("nope.txt", result);
  EXPECT_EQ(result.status, http::StatusCodeNotFound);
  EXPECT_EQ(result.error, TransferError::NotFound);
  EXPECT_TRUE(result.headSent);
  EXPECT_EQ(written, "HTTP/1.1 404 Not Found\r\nContent-Type: text/plain\r\nContent-Length: 9\r\n\r\nNot Found");
  EXPECT_EQ(cache.nbProbes(), 0U);
}

TEST_F(FileDeliveryTest, DirectoryIsNotFound) {
  std::filesystem::create_directories(storage.path() / "sub");
  DeliveryResult result;
  deliverToFile("sub", result);
  EXPECT_EQ(result.status, http::StatusCodeNotFound);
  EXPECT_EQ(result.error, TransferError::NotFound);
}

TEST_F(FileDeliveryTest, TraversalIsForbidden) {
  tmpDir.writeFile("secret.txt", "secret");
  DeliveryResult result;
  const std::string written = deliverToFile("../secret.txt", result);
  EXPECT_EQ(result.status, http::StatusCodeForbidden);
  EXPECT_EQ(result.error, TransferError::PathTraversalRejected);
  EXPECT_EQ(written.find("secret"), std::string::npos);
  EXPECT_TRUE(written.starts_with("HTTP/1.1 403 Forbidden\r\n"));
}

TEST_F(FileDeliveryTest, ClosedOutputIsReported) {
  std::signal(SIGPIPE, SIG_IGN);
  store("x.txt", "x");
  std::array<int, 2> fds{};
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds.data()), 0);
  BaseFd out(fds[0]);
  ::close(fds[1]);
  PreparedDownload prepared = delivery.prepare("x.txt");
  ASSERT_TRUE(prepared.ok());
  const DeliveryResult result = delivery.send(prepared, out.fd(), true);
  EXPECT_FALSE(result.complete());
  EXPECT_EQ(result.sendCode, SendfileResult::Code::OutputError);
}

TEST(FileDelivery, InvalidConfigThrows) {
  test::ScopedTempDir tmpDir;
  StorageRoot storage(tmpDir.dirPath());
  ContentTypeCache cache("application/octet-stream");
  EXPECT_THROW((FileDelivery{storage, cache, DeliveryConfig{}.withSendfileChunkSize(0)}), std::invalid_argument);
}

}  // namespace ferry
