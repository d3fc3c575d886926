#include "ferry/file-helpers.hpp"

#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstddef>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>

#include "ferry/errno-throw.hpp"
#include "ferry/file.hpp"

namespace ferry::test {

std::string ReadFileContent(const std::filesystem::path& path) {
  File file(path);
  if (!file) {
    throw std::runtime_error("Unable to open " + path.string());
  }
  std::string content;
  content.resize_and_overwrite(file.size(), [&file](char* data, std::size_t newCap) {
    const auto readBytes = file.readAt(std::span<char>(data, newCap), 0);
    if (readBytes == File::kError) {
      throw std::runtime_error("Failed to read file content");
    }
    return readBytes;
  });
  return content;
}

std::string ReadAllFromFd(int fd) {
  std::string content;
  std::array<char, 8192> buf;
  while (true) {
    const auto nbRead = ::read(fd, buf.data(), buf.size());
    if (nbRead > 0) {
      content.append(buf.data(), static_cast<std::size_t>(nbRead));
    } else if (nbRead == 0) {
      return content;
    } else if (errno != EINTR) {
      throw_errno("read failed on fd # {}", fd);
    }
  }
}

}  // namespace ferry::test
