#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "encoder.hpp"
#include "types.hpp"

namespace brarchive {

// Collects named entries from disk or memory and writes them as one archive.
// Entries are stored sorted by name regardless of the order they were added.
class Writer {
public:
  Writer() = default;
  ~Writer() = default;

  // Delete copy, enable move
  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  // Add a file from disk. Its content is read when the archive is written.
  // Fails on a missing source, an invalid name or a name already added.
  bool addFile(const std::filesystem::path &sourcePath, const std::string &name,
               FormatError *outError = nullptr);

  // Add an entry from memory (the bytes are copied)
  bool addFile(std::span<const uint8_t> data, const std::string &name,
               FormatError *outError = nullptr);

  // Write the archive to disk through a mapping of its final size. The file is
  // assembled as `<destPath>.partial` and renamed over `destPath` when complete.
  // Fails if `destPath` is itself one of the added source files.
  bool write(const std::filesystem::path &destPath, FormatError *outError = nullptr);

  // Assemble the archive in memory
  std::optional<std::vector<uint8_t>> toBuffer(FormatError *outError = nullptr);

  void clear();

  // Descriptors produced by the last successful write() or toBuffer()
  const std::vector<EntryDescriptor> &files() const { return written_; }

  // Number of entries to be written
  size_t fileCount() const { return pendingFiles_.size(); }

private:
  struct PendingFile {
    std::string name;
    std::filesystem::path sourcePath; // Empty if from memory
    std::vector<uint8_t> data;        // Content if from memory
    bool fromDisk = false;
  };

  bool checkNewName(const std::string &name, FormatError *outError) const;
  std::optional<EncodeLayout> plan(FormatError *outError) const;
  bool emit(const EncodeLayout &layout, std::span<uint8_t> out, FormatError *outError) const;

  std::vector<PendingFile> pendingFiles_;
  std::vector<EntryDescriptor> written_;
};

} // namespace brarchive
