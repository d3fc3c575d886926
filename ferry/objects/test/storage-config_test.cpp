#include "ferry/storage-config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

#include "ferry/scoped-env-var.hpp"
#include "ferry/temp-file.hpp"

namespace ferry {

using test::ScopedEnvVar;
using test::ScopedTempDir;

TEST(StorageConfig, Validate) {
  EXPECT_NO_THROW(StorageConfig{}.validate());
  ScopedTempDir tmp;
  EXPECT_NO_THROW(StorageConfig{}.withDirectory(tmp.dirPath()).validate());
  EXPECT_NO_THROW(StorageConfig{}.withDirectory(tmp.dirPath() / "not-yet").validate());
  const auto file = tmp.writeFile("file.txt", "x");
  EXPECT_THROW(StorageConfig{}.withDirectory(file).validate(), std::invalid_argument);
}

TEST(ResolveDefaultStorageDirectory, PrefersEnvironmentVariable) {
  ScopedTempDir tmp;
  const auto wanted = tmp.dirPath() / "from-env";
  ScopedEnvVar env("FERRY_STORAGE_DIR", wanted.c_str());
  EXPECT_EQ(ResolveDefaultStorageDirectory(), wanted);
  EXPECT_TRUE(std::filesystem::is_directory(wanted));
}

TEST(ResolveDefaultStorageDirectory, FallsBackToHome) {
  ScopedTempDir tmp;
  ScopedEnvVar env("FERRY_STORAGE_DIR", nullptr);
  ScopedEnvVar home("HOME", tmp.dirPath().c_str());
  const auto expected = tmp.dirPath() / ".filetransfer" / "storage";
  EXPECT_EQ(ResolveDefaultStorageDirectory(), expected);
  EXPECT_TRUE(std::filesystem::is_directory(expected));
}

TEST(ResolveDefaultStorageDirectory, SkipsUnusableCandidates) {
  ScopedTempDir tmp;
  const auto blocker = tmp.writeFile("blocker", "not a directory");
  ScopedEnvVar env("FERRY_STORAGE_DIR", (blocker / "sub").c_str());
  ScopedEnvVar home("HOME", blocker.c_str());
  const auto resolved = ResolveDefaultStorageDirectory();
  EXPECT_TRUE(resolved.is_absolute());
  EXPECT_EQ(resolved.filename(), "transfer_storage");
}

}  // namespace ferry
