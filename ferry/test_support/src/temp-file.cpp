#include "ferry/temp-file.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "ferry/base-fd.hpp"
#include "ferry/errno-throw.hpp"

namespace ferry::test {

namespace {

std::string ToHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[value & 0xF];
    value >>= 4;
  }
  return out;
}

std::mt19937_64& ThreadRng() {
  thread_local std::mt19937_64 engine = [] {
    std::random_device rd;
    const auto now = static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    const auto tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    std::array<uint64_t, 3> seeds{static_cast<uint64_t>(rd()), now, tid};
    std::seed_seq seq(seeds.begin(), seeds.end());
    return std::mt19937_64(seq);
  }();
  return engine;
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  std::uniform_int_distribution<uint64_t> dist;
  for (int attempt = 0; attempt < 100; ++attempt) {
    const auto candidate = base / (std::string(prefix) + ToHex(dist(ThreadRng())));
    std::error_code ec;
    if (std::filesystem::create_directories(candidate, ec)) {
      _dir = candidate;
      return;
    }
  }

  throw std::runtime_error("ScopedTempDir: Failed to create temp dir");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

void ScopedTempDir::cleanup() noexcept {
  if (!_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(_dir, ec);
    _dir.clear();
  }
}

std::filesystem::path ScopedTempDir::writeFile(const std::filesystem::path& relative, std::string_view content) const {
  const auto path = _dir / relative;
  std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!ofs) {
    throw std::runtime_error("ScopedTempDir: unable to write " + path.string());
  }
  return path;
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view content) : _content(content) {
  // mkstemp gives an atomic create+open without races
  std::string tmpl = (dir.dirPath() / "ferry_temp_XXXXXX").string();

  BaseFd raii(::mkstemp(tmpl.data()));
  if (!raii) {
    throw_errno("ScopedTempFile: mkstemp failed in {}", dir.dirPath().string());
  }
  _path = tmpl;

  std::string_view remaining = _content;
  while (!remaining.empty()) {
    const auto nbWritten = ::write(raii.fd(), remaining.data(), remaining.size());
    if (nbWritten <= 0) {
      cleanup();
      throw std::runtime_error("ScopedTempFile: write failed");
    }
    remaining.remove_prefix(static_cast<std::size_t>(nbWritten));
  }
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : _path(std::move(other._path)), _content(std::move(other._content)) {
  other._path.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    _content = std::move(other._content);
    other._path.clear();
  }
  return *this;
}

void ScopedTempFile::cleanup() noexcept {
  if (!_path.empty()) {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    _path.clear();
  }
}

}  // namespace ferry::test
