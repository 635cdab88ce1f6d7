#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>

namespace brarchive::format {

// Header magic, stored little-endian as 7D 27 25 B1 A0 52 70 26
inline constexpr uint64_t magic = 0x267052A0B125277Dull;

// Longest entry name in bytes (UTF-8 encoded)
inline constexpr size_t entryNameLenMax = 247;

inline constexpr uint32_t currentVersion = 1;
inline constexpr std::array<uint32_t, 1> supportedVersions = {1};

// Header: magic (8) + entry count (4) + version (4)
inline constexpr size_t headerSize = 16;

// Descriptor: name_len (1) + name (247) + contents_offset (4) + contents_len (4)
inline constexpr size_t descriptorSize = 256;
inline constexpr size_t descriptorNameOffset = 1;
inline constexpr size_t descriptorContentsOffsetField = descriptorNameOffset + entryNameLenMax;
inline constexpr size_t descriptorContentsLenField = descriptorContentsOffsetField + 4;

// Offsets and lengths are u32 fields relative to the content region
inline constexpr uint64_t maxContentRegionSize = 0xFFFFFFFFull;
inline constexpr uint64_t maxEntryCount = 0xFFFFFFFFull;

static_assert(descriptorContentsLenField + 4 == descriptorSize,
              "descriptor fields must fill exactly 256 bytes");

inline constexpr bool isSupportedVersion(uint32_t version) noexcept {
  return std::find(supportedVersions.begin(), supportedVersions.end(), version) !=
         supportedVersions.end();
}

// Computed in 64 bits so that an entry count read from a hostile header cannot wrap
inline constexpr uint64_t contentRegionStart(uint64_t entryCount) noexcept {
  return headerSize + entryCount * descriptorSize;
}

} // namespace brarchive::format
