#include "ferry/sendfile.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <csignal>
#include <chrono>
#include <cstddef>
#include <string>
#include <thread>

#include "ferry/base-fd.hpp"
#include "ferry/file-helpers.hpp"
#include "ferry/file.hpp"
#include "ferry/temp-file.hpp"

namespace ferry {

using namespace std::chrono_literals;
using test::ScopedTempDir;
using test::ScopedTempFile;

namespace {

std::string MakePayload(std::size_t size) {
  std::string payload(size, '\0');
  for (std::size_t pos = 0; pos < size; ++pos) {
    payload[pos] = static_cast<char>('a' + (pos * 7U) % 26U);
  }
  return payload;
}

}  // namespace

TEST(SendFileRange, WholeFileToSocketInSmallChunks) {
  ScopedTempDir dir;
  const std::string payload = MakePayload(300000);
  ScopedTempFile tmp(dir, payload);
  File file(tmp.filePath());
  ASSERT_TRUE(file);

  std::array<int, 2> fds{};
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds.data()), 0);
  BaseFd out(fds[0]);
  BaseFd in(fds[1]);

  std::string received;
  std::jthread consumer([&received, fd = in.fd()] { received = test::ReadAllFromFd(fd); });

  const auto result = SendFileRange(out.fd(), file, 0, file.size(), 4096, 5s);
  out.close();
  consumer.join();

  EXPECT_EQ(result.code, SendfileResult::Code::Done);
  EXPECT_EQ(result.bytesSent, payload.size());
  EXPECT_EQ(received, payload);
}

TEST(SendFileRange, SubRangeToRegularFile) {
  ScopedTempDir dir;
  const std::string payload = MakePayload(10000);
  ScopedTempFile tmp(dir, payload);
  File file(tmp.filePath());
  ASSERT_TRUE(file);

  const auto outPath = dir.dirPath() / "copy.bin";
  {
    File out(outPath, File::OpenMode::WriteTruncate);
    ASSERT_TRUE(out);
    const auto result = SendFileRange(out.fd(), file, 1000, 2500, 1024, 1s);
    EXPECT_EQ(result.code, SendfileResult::Code::Done);
    EXPECT_EQ(result.bytesSent, 2500U);
  }
  EXPECT_EQ(test::ReadFileContent(outPath), payload.substr(1000, 2500));
}

TEST(SendFileRange, EmptyRangeIsDone) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "");
  File file(tmp.filePath());
  ASSERT_TRUE(file);
  std::array<int, 2> fds{};
  ASSERT_EQ(::pipe(fds.data()), 0);
  BaseFd readEnd(fds[0]);
  BaseFd writeEnd(fds[1]);

  const auto result = SendFileRange(writeEnd.fd(), file, 0, 0, 4096, 1s);
  EXPECT_EQ(result.code, SendfileResult::Code::Done);
  EXPECT_EQ(result.bytesSent, 0U);
}

TEST(SendFileRange, FileShorterThanRequestedIsInputError) {
  ScopedTempDir dir;
  ScopedTempFile tmp(dir, "short");
  File file(tmp.filePath());
  ASSERT_TRUE(file);

  const auto outPath = dir.dirPath() / "copy.bin";
  File out(outPath, File::OpenMode::WriteTruncate);
  ASSERT_TRUE(out);
  const auto result = SendFileRange(out.fd(), file, 0, 100, 4096, 1s);
  EXPECT_EQ(result.code, SendfileResult::Code::InputError);
  EXPECT_EQ(result.bytesSent, 5U);
}

TEST(SendFileRange, ClosedPeerIsOutputError) {
  ScopedTempDir dir;
  const std::string payload = MakePayload(1 << 20);
  ScopedTempFile tmp(dir, payload);
  File file(tmp.filePath());
  ASSERT_TRUE(file);

  std::array<int, 2> fds{};
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds.data()), 0);
  BaseFd out(fds[0]);
  BaseFd in(fds[1]);
  in.close();

  // sendfile has no MSG_NOSIGNAL equivalent
  std::signal(SIGPIPE, SIG_IGN);
  const auto result = SendFileRange(out.fd(), file, 0, file.size(), 65536, 1s);
  EXPECT_EQ(result.code, SendfileResult::Code::OutputError);
  EXPECT_LT(result.bytesSent, payload.size());
}

}  // namespace ferry
