#include <algorithm>
#include <cstring>
#include <format>
#include <limits>
#include <string_view>
#include <utility>

#include <brarchive/encoder.hpp>
#include <brarchive/endian.hpp>
#include <brarchive/format.hpp>

#include "error.hpp"

namespace brarchive {

using detail::setError;

namespace {

using ContentRef = std::pair<std::string_view, std::span<const uint8_t>>;

bool byName(const ContentRef &a, const ContentRef &b) {
  return a.first < b.first;
}

std::optional<std::vector<uint8_t>> encodeRefs(std::vector<ContentRef> refs,
                                               FormatError *outError) {
  std::vector<EntryDescriptor> entries;
  entries.reserve(refs.size());

  for (const auto &[name, content] : refs) {
    if (content.size() > std::numeric_limits<uint32_t>::max()) {
      setError(outError, FormatErrorKind::ArchiveTooLarge, 0,
               std::format("Entry '{}' is {} bytes, larger than a 32-bit length field", name,
                           content.size()));
      return std::nullopt;
    }

    EntryDescriptor entry;
    entry.name.assign(name);
    entry.contentsLen = static_cast<uint32_t>(content.size());
    entries.push_back(std::move(entry));
  }

  auto layout = planLayout(std::move(entries), outError);
  if (!layout) {
    return std::nullopt;
  }

  // planLayout rejected duplicates, so this order matches layout->descriptors
  std::sort(refs.begin(), refs.end(), byName);

  std::vector<uint8_t> output(layout->totalSize);
  writeTables(*layout, output);

  size_t pos = layout->contentStart;
  for (const auto &ref : refs) {
    if (!ref.second.empty()) {
      std::memcpy(output.data() + pos, ref.second.data(), ref.second.size());
    }
    pos += ref.second.size();
  }

  return output;
}

} // namespace

std::optional<EncodeLayout> planLayout(std::vector<EntryDescriptor> entries,
                                       FormatError *outError) {
  std::sort(entries.begin(), entries.end(),
            [](const EntryDescriptor &a, const EntryDescriptor &b) { return a.name < b.name; });

  for (size_t i = 0; i < entries.size(); ++i) {
    if (!detail::checkEntryName(entries[i].name, outError)) {
      return std::nullopt;
    }

    if (i > 0 && entries[i].name == entries[i - 1].name) {
      setError(outError, FormatErrorKind::DuplicateName, 0,
               std::format("Duplicate entry name: {}", entries[i].name));
      return std::nullopt;
    }
  }

  if (entries.size() > format::maxEntryCount) {
    setError(outError, FormatErrorKind::ArchiveTooLarge, 0,
             std::format("Too many entries for a 32-bit count field: {}", entries.size()));
    return std::nullopt;
  }

  uint64_t contentSize = 0;
  for (auto &entry : entries) {
    if (contentSize + entry.contentsLen > format::maxContentRegionSize) {
      setError(outError, FormatErrorKind::ArchiveTooLarge, 0,
               std::format("Content region would exceed {} bytes at entry '{}' "
                           "(offset={}, size={})",
                           format::maxContentRegionSize, entry.name, contentSize,
                           entry.contentsLen));
      return std::nullopt;
    }

    entry.contentsOffset = static_cast<uint32_t>(contentSize);
    contentSize += entry.contentsLen;
  }

  const uint64_t contentStart = format::contentRegionStart(entries.size());
  const uint64_t totalSize = contentStart + contentSize;
  if (totalSize > std::numeric_limits<size_t>::max()) {
    setError(outError, FormatErrorKind::ArchiveTooLarge, 0,
             std::format("Archive of {} bytes is not addressable on this platform", totalSize));
    return std::nullopt;
  }

  EncodeLayout layout;
  layout.descriptors = std::move(entries);
  layout.contentStart = static_cast<size_t>(contentStart);
  layout.totalSize = static_cast<size_t>(totalSize);
  return layout;
}

void writeTables(const EncodeLayout &layout, std::span<uint8_t> out) {
  std::fill(out.begin(), out.begin() + layout.contentStart, uint8_t{0});

  writeLE64(out, 0, format::magic);
  writeLE32(out, 8, static_cast<uint32_t>(layout.descriptors.size()));
  writeLE32(out, 12, format::currentVersion);

  size_t pos = format::headerSize;
  for (const auto &descriptor : layout.descriptors) {
    out[pos] = static_cast<uint8_t>(descriptor.name.size());
    std::memcpy(out.data() + pos + format::descriptorNameOffset, descriptor.name.data(),
                descriptor.name.size());
    writeLE32(out, pos + format::descriptorContentsOffsetField, descriptor.contentsOffset);
    writeLE32(out, pos + format::descriptorContentsLenField, descriptor.contentsLen);
    pos += format::descriptorSize;
  }
}

std::optional<std::vector<uint8_t>> encode(const EntryMap &entries, FormatError *outError) {
  std::vector<ContentRef> refs;
  refs.reserve(entries.size());
  for (const auto &[name, content] : entries) {
    refs.emplace_back(name, content);
  }
  return encodeRefs(std::move(refs), outError);
}

std::optional<std::vector<uint8_t>> encode(std::span<const ArchiveEntry> entries,
                                           FormatError *outError) {
  std::vector<ContentRef> refs;
  refs.reserve(entries.size());
  for (const auto &entry : entries) {
    refs.emplace_back(entry.name, entry.content);
  }
  return encodeRefs(std::move(refs), outError);
}

std::optional<size_t> encodedSize(const EntryMap &entries, FormatError *outError) {
  std::vector<EntryDescriptor> descriptors;
  descriptors.reserve(entries.size());

  for (const auto &[name, content] : entries) {
    if (content.size() > std::numeric_limits<uint32_t>::max()) {
      setError(outError, FormatErrorKind::ArchiveTooLarge, 0,
               std::format("Entry '{}' is {} bytes, larger than a 32-bit length field", name,
                           content.size()));
      return std::nullopt;
    }
    descriptors.push_back({name, 0, static_cast<uint32_t>(content.size())});
  }

  auto layout = planLayout(std::move(descriptors), outError);
  if (!layout) {
    return std::nullopt;
  }
  return layout->totalSize;
}

} // namespace brarchive
