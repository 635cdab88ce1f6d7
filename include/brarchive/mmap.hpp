#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "types.hpp"

namespace brarchive {

// RAII wrapper for memory-mapped files
// Supports both read-only and read-write modes
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  // Delete copy, enable move
  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Map an existing, non-empty file read-only
  bool openRead(const std::filesystem::path &path, FormatError *outError = nullptr);

  // Create (or truncate) a file of exactly `size` bytes and map it read-write
  bool openWrite(const std::filesystem::path &path, size_t size,
                 FormatError *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }

  std::span<uint8_t> data() { return std::span<uint8_t>(static_cast<uint8_t *>(data_), size_); }

  // Flush changes to disk (write mode only)
  bool flush(FormatError *outError = nullptr);

  void close();

  bool isOpen() const { return data_ != nullptr; }
  bool isWritable() const { return writable_; }
  size_t size() const { return size_; }

private:
  void cleanup() noexcept;

#ifdef _WIN32
  void *fileHandle_ = nullptr;    // HANDLE on Windows
  void *mappingHandle_ = nullptr; // HANDLE on Windows
#else
  int fd_ = -1;
#endif
  void *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
};

} // namespace brarchive
