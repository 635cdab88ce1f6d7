#include <algorithm>
#include <format>
#include <string_view>

#include <brarchive/decoder.hpp>
#include <brarchive/endian.hpp>
#include <brarchive/format.hpp>
#include <brarchive/utf8.hpp>

#include "error.hpp"

namespace brarchive {

using detail::setError;

std::optional<ArchiveHeader> readHeader(std::span<const uint8_t> buffer, FormatError *outError) {
  if (buffer.size() < sizeof(uint64_t)) {
    setError(outError, FormatErrorKind::TruncatedBuffer, 0,
             std::format("Buffer too small to hold the archive magic (size: {})",
                         buffer.size()));
    return std::nullopt;
  }

  ArchiveHeader header;
  header.magic = readLE64(buffer, 0);
  if (header.magic != format::magic) {
    setError(outError, FormatErrorKind::MagicMismatch, 0,
             std::format("Invalid archive magic (expected {:#018x}, got {:#018x})",
                         format::magic, header.magic));
    return std::nullopt;
  }

  if (buffer.size() < format::headerSize) {
    setError(outError, FormatErrorKind::TruncatedBuffer, 8,
             std::format("Buffer too small to hold the archive header (size: {}, need: {})",
                         buffer.size(), format::headerSize));
    return std::nullopt;
  }

  header.entryCount = readLE32(buffer, 8);
  header.version = readLE32(buffer, 12);

  if (!format::isSupportedVersion(header.version)) {
    setError(outError, FormatErrorKind::UnsupportedVersion, 12,
             std::format("Unsupported archive version {} (supported: {})", header.version,
                         format::currentVersion));
    return std::nullopt;
  }

  return header;
}

std::optional<ArchiveLayout> readDescriptors(std::span<const uint8_t> buffer,
                                             FormatError *outError) {
  auto header = readHeader(buffer, outError);
  if (!header) {
    return std::nullopt;
  }

  ArchiveLayout layout;
  layout.header = *header;
  layout.contentStart = format::contentRegionStart(header->entryCount);

  // Don't trust the header count for the reservation until the table is known to fit
  if (layout.contentStart <= buffer.size()) {
    layout.descriptors.reserve(header->entryCount);
  }

  for (uint32_t i = 0; i < header->entryCount; ++i) {
    const uint64_t pos = format::headerSize + static_cast<uint64_t>(i) * format::descriptorSize;

    if (pos + format::descriptorSize > buffer.size()) {
      setError(outError, FormatErrorKind::TruncatedBuffer, static_cast<size_t>(pos),
               std::format("Descriptor {} of {} extends beyond buffer bounds (offset={}, "
                           "bufferSize={})",
                           i, header->entryCount, pos, buffer.size()));
      return std::nullopt;
    }

    const size_t base = static_cast<size_t>(pos);
    const uint8_t nameLen = buffer[base];
    if (nameLen > format::entryNameLenMax) {
      setError(outError, FormatErrorKind::NameTooLong, base,
               std::format("Descriptor {} has name length {} (limit is {})", i, nameLen,
                           format::entryNameLenMax));
      return std::nullopt;
    }

    std::string_view name(reinterpret_cast<const char *>(buffer.data()) + base +
                              format::descriptorNameOffset,
                          nameLen);
    if (auto bad = firstInvalidUtf8(name)) {
      setError(outError, FormatErrorKind::InvalidUtf8,
               base + format::descriptorNameOffset + *bad,
               std::format("Descriptor {} has a name that is not valid UTF-8 (byte {})", i,
                           *bad));
      return std::nullopt;
    }

    EntryDescriptor descriptor;
    descriptor.name.assign(name);
    descriptor.contentsOffset = readLE32(buffer, base + format::descriptorContentsOffsetField);
    descriptor.contentsLen = readLE32(buffer, base + format::descriptorContentsLenField);
    layout.descriptors.push_back(std::move(descriptor));
  }

  return layout;
}

std::optional<std::span<const uint8_t>> sliceContent(std::span<const uint8_t> buffer,
                                                     const ArchiveLayout &layout,
                                                     const EntryDescriptor &descriptor,
                                                     FormatError *outError) {
  const uint64_t begin = layout.contentStart + descriptor.contentsOffset;
  const uint64_t end = begin + descriptor.contentsLen;

  if (end > buffer.size()) {
    setError(outError, FormatErrorKind::TruncatedBuffer,
             static_cast<size_t>(std::min<uint64_t>(begin, buffer.size())),
             std::format("Entry '{}' has invalid offset/size (offset={}, size={}, "
                         "contentStart={}, bufferSize={})",
                         descriptor.name, descriptor.contentsOffset, descriptor.contentsLen,
                         layout.contentStart, buffer.size()));
    return std::nullopt;
  }

  return buffer.subspan(static_cast<size_t>(begin), descriptor.contentsLen);
}

std::optional<DecodedArchive> decode(std::span<const uint8_t> buffer, FormatError *outError,
                                     const DecodeOptions &options) {
  auto layout = readDescriptors(buffer, outError);
  if (!layout) {
    return std::nullopt;
  }

  DecodedArchive archive;
  archive.entryCount = layout->header.entryCount;
  archive.version = layout->header.version;

  for (const auto &descriptor : layout->descriptors) {
    auto content = sliceContent(buffer, *layout, descriptor, outError);
    if (!content) {
      return std::nullopt;
    }

    std::vector<uint8_t> bytes(content->begin(), content->end());

    if (options.duplicates == DuplicatePolicy::Reject) {
      if (!archive.entries.try_emplace(descriptor.name, std::move(bytes)).second) {
        setError(outError, FormatErrorKind::DuplicateName, 0,
                 std::format("Duplicate entry name in archive: {}", descriptor.name));
        return std::nullopt;
      }
    } else {
      archive.entries.insert_or_assign(descriptor.name, std::move(bytes));
    }
  }

  return archive;
}

} // namespace brarchive
