#pragma once

#include <filesystem>
#include <string_view>

#include "ferry/file.hpp"

namespace ferry {

// Destination of the payload of one part.
class PartSink {
 public:
  PartSink() noexcept = default;

  PartSink(const PartSink&) = delete;
  PartSink& operator=(const PartSink&) = delete;

  virtual ~PartSink() = default;

  // Append 'data'. Returns false on error, after which the sink is unusable.
  [[nodiscard]] virtual bool write(std::string_view data) = 0;

  // Flush and close after the last byte. Returns false if deferred errors were reported.
  [[nodiscard]] virtual bool finish() = 0;

  // Close the sink of an interrupted part, removing what has been written if 'removePartial' is true.
  virtual void abandon(bool removePartial) noexcept = 0;

 protected:
  PartSink(PartSink&&) noexcept = default;
  PartSink& operator=(PartSink&&) noexcept = default;
};

// Writes the payload to a regular file created (or truncated) at a path validated by the caller.
class FilePartSink final : public PartSink {
 public:
  explicit FilePartSink(std::filesystem::path path);

  // False if the destination could not be created. openErrno() tells why.
  explicit operator bool() const noexcept { return static_cast<bool>(_file); }

  [[nodiscard]] int openErrno() const noexcept { return _file.openErrno(); }

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return _path; }

  [[nodiscard]] bool write(std::string_view data) override { return _file.writeAll(data); }

  [[nodiscard]] bool finish() override { return _file.close(); }

  void abandon(bool removePartial) noexcept override;

 private:
  std::filesystem::path _path;
  File _file;
};

// Consumes the payload of parts that are not persisted (plain form fields).
class DiscardPartSink final : public PartSink {
 public:
  [[nodiscard]] bool write([[maybe_unused]] std::string_view data) override { return true; }

  [[nodiscard]] bool finish() override { return true; }

  void abandon([[maybe_unused]] bool removePartial) noexcept override {}
};

}  // namespace ferry
