#pragma once

#include <filesystem>
#include <string>

namespace ferry::test {

// Whole content of the file at 'path'. Throws std::runtime_error if it cannot be read.
std::string ReadFileContent(const std::filesystem::path& path);

// Whole content readable from 'fd' until end of file / peer shutdown.
std::string ReadAllFromFd(int fd);

}  // namespace ferry::test
