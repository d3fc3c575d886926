#include "ferry/upload-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace ferry {

TEST(UploadConfig, DefaultsAreValid) {
  UploadConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.bufferSize, 64UL * 1024UL);
  EXPECT_EQ(config.progressIntervalBytes, 10UL * 1024UL * 1024UL);
  EXPECT_FALSE(config.deletePartialOnAbort);
  EXPECT_EQ(config.fieldPartPolicy, UploadConfig::FieldPartPolicy::Skip);
  EXPECT_EQ(config.filenameDecoding, UploadConfig::FilenameDecoding::Lenient);
}

TEST(UploadConfig, Builders) {
  UploadConfig config;
  config.withBufferSize(8192)
      .withMaxHeaderBlockBytes(1024)
      .withProgressIntervalBytes(0)
      .withMaxParts(3)
      .withDeletePartialOnAbort()
      .withFieldPartPolicy(UploadConfig::FieldPartPolicy::Stop)
      .withFilenameDecoding(UploadConfig::FilenameDecoding::Strict);
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.bufferSize, 8192U);
  EXPECT_EQ(config.maxHeaderBlockBytes, 1024U);
  EXPECT_EQ(config.progressIntervalBytes, 0U);
  EXPECT_EQ(config.maxParts, 3U);
  EXPECT_TRUE(config.deletePartialOnAbort);
  EXPECT_EQ(config.fieldPartPolicy, UploadConfig::FieldPartPolicy::Stop);
  EXPECT_EQ(config.filenameDecoding, UploadConfig::FilenameDecoding::Strict);
}

TEST(UploadConfig, BufferTooSmall) {
  UploadConfig config;
  config.withBufferSize(UploadConfig::kMinBufferSize - 1).withMaxHeaderBlockBytes(512);
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.withBufferSize(UploadConfig::kMinBufferSize);
  EXPECT_NO_THROW(config.validate());
}

TEST(UploadConfig, HeaderBlockMustFitInBuffer) {
  UploadConfig config;
  config.withBufferSize(8192).withMaxHeaderBlockBytes(8193);
  EXPECT_THROW(config.validate(), std::invalid_argument);
  config.withMaxHeaderBlockBytes(0);
  EXPECT_THROW(config.validate(), std::invalid_argument);
}

}  // namespace ferry
