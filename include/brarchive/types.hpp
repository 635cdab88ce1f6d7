#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "format.hpp"

namespace brarchive {

// Archive header (16 bytes, little-endian)
struct ArchiveHeader {
  uint64_t magic = format::magic;
  uint32_t entryCount = 0;
  uint32_t version = format::currentVersion;
};

// One 256-byte descriptor. The name is held unpadded; the zero-padded
// 247-byte slot exists only in the serialized form.
struct EntryDescriptor {
  std::string name;
  uint32_t contentsOffset = 0; // Relative to the start of the content region
  uint32_t contentsLen = 0;

  bool operator==(const EntryDescriptor &) const = default;
};

// Named byte blob
struct ArchiveEntry {
  std::string name;
  std::vector<uint8_t> content;

  bool operator==(const ArchiveEntry &) const = default;
};

// Canonical in-memory archive. std::string ordering compares bytes as
// unsigned char, which is the descriptor order on disk.
using EntryMap = std::map<std::string, std::vector<uint8_t>>;

// Result of decoding a whole buffer
struct DecodedArchive {
  EntryMap entries;
  uint32_t entryCount = 0; // As stored in the header
  uint32_t version = 0;
};

enum class FormatErrorKind {
  MagicMismatch,
  UnsupportedVersion,
  NameTooLong,
  InvalidUtf8,
  TruncatedBuffer,
  ArchiveTooLarge,
  DuplicateName,
  Io,
};

std::string_view toString(FormatErrorKind kind) noexcept;

// Error reported through the `outError` out-parameter
struct FormatError {
  FormatErrorKind kind = FormatErrorKind::Io;
  std::string message;
  size_t offset = 0; // Byte offset in the buffer where the problem was detected
};

} // namespace brarchive
