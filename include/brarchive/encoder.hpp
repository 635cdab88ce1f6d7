#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "types.hpp"

namespace brarchive {

// Serialized layout of an archive before any content is copied
struct EncodeLayout {
  std::vector<EntryDescriptor> descriptors; // Sorted by name, offsets assigned
  size_t contentStart = 0;                  // Absolute offset of the content region
  size_t totalSize = 0;                     // Header + descriptors + content
};

// Sort entries by name and assign gapless content offsets.
// Only `name` and `contentsLen` of each input descriptor are used.
std::optional<EncodeLayout> planLayout(std::vector<EntryDescriptor> entries,
                                       FormatError *outError = nullptr);

// Write header and descriptor table into out[0, layout.contentStart).
// `out` must be at least layout.contentStart bytes.
void writeTables(const EncodeLayout &layout, std::span<uint8_t> out);

// Encode a mapping. Output is deterministic for equal mappings.
std::optional<std::vector<uint8_t>> encode(const EntryMap &entries,
                                           FormatError *outError = nullptr);

// Encode a sequence in any order. Repeated names fail with DuplicateName.
std::optional<std::vector<uint8_t>> encode(std::span<const ArchiveEntry> entries,
                                           FormatError *outError = nullptr);

// Size in bytes that encode(entries) would produce
std::optional<size_t> encodedSize(const EntryMap &entries, FormatError *outError = nullptr);

} // namespace brarchive
