#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace ferry::test {

// ScopedTempDir: creates a unique temporary directory under the system temp
// directory and removes it (recursively) on destruction.
class ScopedTempDir {
 public:
  explicit ScopedTempDir(std::string_view prefix = "ferry-temp-dir-");

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;
  ScopedTempDir(ScopedTempDir&& other) noexcept;
  ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

  ~ScopedTempDir();

  [[nodiscard]] const std::filesystem::path& dirPath() const noexcept { return _dir; }

  // Create (or overwrite) 'relative' under the directory with the given content, creating
  // intermediate directories. Returns its full path.
  std::filesystem::path writeFile(const std::filesystem::path& relative, std::string_view content) const;

 private:
  void cleanup() noexcept;

  std::filesystem::path _dir;
};

// ScopedTempFile: a uniquely named file inside an existing ScopedTempDir, removed on destruction.
class ScopedTempFile {
 public:
  ScopedTempFile(const ScopedTempDir& dir, std::string_view content);

  ScopedTempFile(ScopedTempDir&& dir, std::string_view content) = delete;

  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;
  ScopedTempFile(ScopedTempFile&& other) noexcept;
  ScopedTempFile& operator=(ScopedTempFile&& other) noexcept;

  ~ScopedTempFile() { cleanup(); }

  [[nodiscard]] const std::filesystem::path& filePath() const noexcept { return _path; }
  [[nodiscard]] std::string filename() const { return _path.filename().string(); }
  [[nodiscard]] std::string_view content() const noexcept { return _content; }

  void cleanup() noexcept;

 private:
  std::filesystem::path _path;
  std::string _content;
};

}  // namespace ferry::test
