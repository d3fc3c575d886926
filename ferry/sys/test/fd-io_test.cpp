#include "ferry/fd-io.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <string>
#include <thread>

#include "ferry/base-fd.hpp"
#include "ferry/file-helpers.hpp"

namespace ferry {

using namespace std::chrono_literals;

TEST(FdIo, WriteFullyToPipe) {
  std::array<int, 2> fds{};
  ASSERT_EQ(::pipe(fds.data()), 0);
  BaseFd readEnd(fds[0]);
  BaseFd writeEnd(fds[1]);

  ASSERT_TRUE(WriteFully(writeEnd.fd(), "some bytes", 1s));
  writeEnd.close();
  EXPECT_EQ(test::ReadAllFromFd(readEnd.fd()), "some bytes");
}

TEST(FdIo, WriteFullyNonBlockingSocketLargerThanBuffer) {
  std::array<int, 2> fds{};
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds.data()), 0);
  BaseFd writer(fds[0]);
  BaseFd reader(fds[1]);
  ASSERT_EQ(::fcntl(writer.fd(), F_SETFL, ::fcntl(writer.fd(), F_GETFL) | O_NONBLOCK), 0);

  // Much larger than the default socket buffers, forcing EAGAIN + poll cycles
  const std::string payload(4UL * 1024UL * 1024UL, 'z');
  std::string received;
  std::jthread consumer([&received, fd = reader.fd()] { received = test::ReadAllFromFd(fd); });

  ASSERT_TRUE(WriteFully(writer.fd(), payload, 5s));
  writer.close();
  consumer.join();
  EXPECT_EQ(received.size(), payload.size());
  EXPECT_EQ(received, payload);
}

TEST(FdIo, WaitWritableTimesOutWhenBufferFull) {
  std::array<int, 2> fds{};
  ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds.data()), 0);
  BaseFd writer(fds[0]);
  BaseFd reader(fds[1]);
  ASSERT_EQ(::fcntl(writer.fd(), F_SETFL, ::fcntl(writer.fd(), F_GETFL) | O_NONBLOCK), 0);

  std::array<char, 4096> chunk{};
  while (::write(writer.fd(), chunk.data(), chunk.size()) > 0) {
  }
  EXPECT_FALSE(WaitWritable(writer.fd(), 10ms));
  EXPECT_FALSE(WriteFully(writer.fd(), "x", 10ms));
}

TEST(FdIo, WriteFullyToClosedFdFails) { EXPECT_FALSE(WriteFully(-1, "data", 10ms)); }

}  // namespace ferry
