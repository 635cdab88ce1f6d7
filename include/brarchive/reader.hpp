#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "decoder.hpp"
#include "mmap.hpp"
#include "types.hpp"

namespace brarchive {

// Memory-mapped view of an archive on disk. Descriptors are parsed on open;
// content is sliced out of the mapping on demand.
class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  // Delete copy, enable move
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Open and validate an archive. Every entry's content bounds are checked here,
  // so later views never fail on a successfully opened archive.
  static std::optional<Reader> open(const std::filesystem::path &path,
                                    FormatError *outError = nullptr,
                                    const DecodeOptions &options = {});

  // Descriptors in stored order, duplicates included
  const std::vector<EntryDescriptor> &entries() const { return layout_.descriptors; }

  size_t entryCount() const { return layout_.descriptors.size(); }

  uint32_t version() const { return layout_.header.version; }

  // Exact, case-sensitive lookup. With duplicate names, the last descriptor wins.
  // Returns nullptr if no entry has this name.
  const EntryDescriptor *findEntry(const std::string &name) const;

  // Zero-copy view into the mapping, valid until close()
  std::span<const uint8_t> getEntryView(const EntryDescriptor &entry) const;

  std::optional<std::vector<uint8_t>> extractToMemory(const EntryDescriptor &entry,
                                                      FormatError *outError = nullptr) const;

  // Write one entry beneath `destRoot`, using its name as a relative path.
  // Names that are absolute or climb out of `destRoot` are refused.
  bool extract(const EntryDescriptor &entry, const std::filesystem::path &destRoot,
               FormatError *outError = nullptr) const;

  // Decode every entry into memory
  std::optional<DecodedArchive> decodeAll(FormatError *outError = nullptr) const;

  bool isOpen() const;

  void close();

private:
  bool index(FormatError *outError);

  MappedFile mappedFile_;
  ArchiveLayout layout_;
  DecodeOptions options_;
  std::unordered_map<std::string, size_t> lookup_; // name -> descriptor index
};

} // namespace brarchive
