#include "ferry/fd-byte-source.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "ferry/base-fd.hpp"
#include "ferry/byte-source.hpp"
#include "ferry/fd-io.hpp"

namespace ferry {

using namespace std::chrono_literals;

namespace {

class FdByteSourceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::array<int, 2> fds{};
    ASSERT_EQ(::pipe(fds.data()), 0);
    readEnd = BaseFd(fds[0]);
    writeEnd = BaseFd(fds[1]);
  }

  void feed(std::string_view data) { ASSERT_TRUE(WriteFully(writeEnd.fd(), data, 1s)); }

  std::string drain(ByteSource& source, ReadResult::Status& lastStatus) {
    std::string out;
    std::array<char, 7> buf{};
    while (true) {
      const auto res = source.read(buf);
      lastStatus = res.status;
      if (res.status != ReadResult::Status::Data) {
        return out;
      }
      out.append(buf.data(), res.nbBytes);
    }
  }

  BaseFd readEnd;
  BaseFd writeEnd;
};

}  // namespace

TEST_F(FdByteSourceTest, ReadsUntilEofWithoutLength) {
  feed("hello world");
  writeEnd.close();
  FdByteSource source(readEnd.fd());
  ReadResult::Status last{};
  EXPECT_EQ(drain(source, last), "hello world");
  EXPECT_EQ(last, ReadResult::Status::End);
  EXPECT_EQ(source.totalRead(), 11U);
}

TEST_F(FdByteSourceTest, PrefetchedBytesComeFirst) {
  feed("-tail");
  writeEnd.close();
  FdByteSource source(readEnd.fd(), std::nullopt, "head");
  ReadResult::Status last{};
  EXPECT_EQ(drain(source, last), "head-tail");
  EXPECT_EQ(last, ReadResult::Status::End);
}

TEST_F(FdByteSourceTest, StopsAtDeclaredLength) {
  // Bytes after the declared body belong to the next request and must not be consumed
  feed("0123456789NEXT");
  FdByteSource source(readEnd.fd(), uint64_t{10}, "");
  ReadResult::Status last{};
  EXPECT_EQ(drain(source, last), "0123456789");
  EXPECT_EQ(last, ReadResult::Status::End);
  EXPECT_EQ(source.totalRead(), 10U);

  std::array<char, 8> rest{};
  EXPECT_EQ(::read(readEnd.fd(), rest.data(), rest.size()), 4);
}

TEST_F(FdByteSourceTest, PrefetchedCountsTowardsLength) {
  feed("6789");
  FdByteSource source(readEnd.fd(), uint64_t{10}, "012345");
  ReadResult::Status last{};
  EXPECT_EQ(drain(source, last), "0123456789");
  EXPECT_EQ(last, ReadResult::Status::End);
}

TEST_F(FdByteSourceTest, EofBeforeDeclaredLengthIsError) {
  feed("abc");
  writeEnd.close();
  FdByteSource source(readEnd.fd(), uint64_t{10});
  ReadResult::Status last{};
  EXPECT_EQ(drain(source, last), "abc");
  EXPECT_EQ(last, ReadResult::Status::Error);
}

TEST_F(FdByteSourceTest, ReadTimeoutIsError) {
  ASSERT_EQ(::fcntl(readEnd.fd(), F_SETFL, ::fcntl(readEnd.fd(), F_GETFL) | O_NONBLOCK), 0);
  FdByteSource source(readEnd.fd(), uint64_t{10}, "", 20ms);
  std::array<char, 4> buf{};
  EXPECT_EQ(source.read(buf).status, ReadResult::Status::Error);
}

}  // namespace ferry
