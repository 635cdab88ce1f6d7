#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "types.hpp"

namespace brarchive {

// What to do when two descriptors carry the same name
enum class DuplicatePolicy {
  LastWins, // Later descriptor replaces the earlier one
  Reject,   // Fail with FormatErrorKind::DuplicateName
};

struct DecodeOptions {
  DuplicatePolicy duplicates = DuplicatePolicy::LastWins;
};

// Header plus validated descriptor table, without any content copied
struct ArchiveLayout {
  ArchiveHeader header;
  std::vector<EntryDescriptor> descriptors; // Descriptor order as stored
  uint64_t contentStart = 0;                // Absolute offset of the content region
};

// Read and validate the 16-byte header
std::optional<ArchiveHeader> readHeader(std::span<const uint8_t> buffer,
                                        FormatError *outError = nullptr);

// Read the header and every descriptor. Content slices are not checked here.
std::optional<ArchiveLayout> readDescriptors(std::span<const uint8_t> buffer,
                                             FormatError *outError = nullptr);

// Zero-copy view of one entry's content.
// Fails with TruncatedBuffer if the slice extends past the end of `buffer`.
std::optional<std::span<const uint8_t>> sliceContent(std::span<const uint8_t> buffer,
                                                     const ArchiveLayout &layout,
                                                     const EntryDescriptor &descriptor,
                                                     FormatError *outError = nullptr);

// Decode a complete archive into a name -> content mapping
std::optional<DecodedArchive> decode(std::span<const uint8_t> buffer,
                                     FormatError *outError = nullptr,
                                     const DecodeOptions &options = {});

} // namespace brarchive
