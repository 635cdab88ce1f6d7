#include <algorithm>
#include <cstdint>
#include <format>
#include <fstream>
#include <limits>
#include <system_error>
#include <unordered_map>

#include <brarchive/mmap.hpp>
#include <brarchive/writer.hpp>

#include "error.hpp"

namespace brarchive {

using detail::setError;

bool Writer::checkNewName(const std::string &name, FormatError *outError) const {
  if (!detail::checkEntryName(name, outError)) {
    return false;
  }

  auto it = std::find_if(pendingFiles_.begin(), pendingFiles_.end(),
                         [&](const PendingFile &pending) { return pending.name == name; });
  if (it != pendingFiles_.end()) {
    setError(outError, FormatErrorKind::DuplicateName, 0,
             std::format("Duplicate entry name in archive: {}", name));
    return false;
  }

  return true;
}

bool Writer::addFile(const std::filesystem::path &sourcePath, const std::string &name,
                     FormatError *outError) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sourcePath, ec)) {
    setError(outError, FormatErrorKind::Io, 0,
             std::format("Source file does not exist: {}", sourcePath.string()));
    return false;
  }

  if (!checkNewName(name, outError)) {
    return false;
  }

  PendingFile pending;
  pending.name = name;
  pending.sourcePath = sourcePath;
  pending.fromDisk = true;
  pendingFiles_.push_back(std::move(pending));
  return true;
}

bool Writer::addFile(std::span<const uint8_t> data, const std::string &name,
                     FormatError *outError) {
  if (data.size() > std::numeric_limits<uint32_t>::max()) {
    setError(outError, FormatErrorKind::ArchiveTooLarge, 0,
             std::format("Entry '{}' is {} bytes, larger than a 32-bit length field", name,
                         data.size()));
    return false;
  }

  if (!checkNewName(name, outError)) {
    return false;
  }

  PendingFile pending;
  pending.name = name;
  pending.data.assign(data.begin(), data.end());
  pendingFiles_.push_back(std::move(pending));
  return true;
}

std::optional<EncodeLayout> Writer::plan(FormatError *outError) const {
  std::vector<EntryDescriptor> entries;
  entries.reserve(pendingFiles_.size());

  for (const auto &pending : pendingFiles_) {
    uintmax_t size = pending.data.size();
    if (pending.fromDisk) {
      std::error_code ec;
      size = std::filesystem::file_size(pending.sourcePath, ec);
      if (ec) {
        setError(outError, FormatErrorKind::Io, 0,
                 std::format("Failed to get file size: {}: {}", pending.sourcePath.string(),
                             ec.message()));
        return std::nullopt;
      }
    }

    if (size > std::numeric_limits<uint32_t>::max()) {
      setError(outError, FormatErrorKind::ArchiveTooLarge, 0,
               std::format("Entry '{}' is {} bytes, larger than a 32-bit length field",
                           pending.name, size));
      return std::nullopt;
    }

    entries.push_back({pending.name, 0, static_cast<uint32_t>(size)});
  }

  return planLayout(std::move(entries), outError);
}

bool Writer::emit(const EncodeLayout &layout, std::span<uint8_t> out,
                  FormatError *outError) const {
  writeTables(layout, out);

  std::unordered_map<std::string_view, const PendingFile *> byName;
  byName.reserve(pendingFiles_.size());
  for (const auto &pending : pendingFiles_) {
    byName.emplace(pending.name, &pending);
  }

  for (const auto &descriptor : layout.descriptors) {
    const PendingFile &pending = *byName.at(descriptor.name);
    uint8_t *dest = out.data() + layout.contentStart + descriptor.contentsOffset;

    if (!pending.fromDisk) {
      std::copy(pending.data.begin(), pending.data.end(), dest);
      continue;
    }

    // Read straight into the output; the size was fixed when the layout was planned
    std::ifstream inFile(pending.sourcePath, std::ios::binary);
    if (!inFile) {
      setError(outError, FormatErrorKind::Io, 0,
               std::format("Failed to open source file: {}", pending.sourcePath.string()));
      return false;
    }

    if (!inFile.read(reinterpret_cast<char *>(dest),
                     static_cast<std::streamsize>(descriptor.contentsLen))) {
      setError(outError, FormatErrorKind::Io, 0,
               std::format("Failed to read {} bytes from source file (changed while writing?): "
                           "{}",
                           descriptor.contentsLen, pending.sourcePath.string()));
      return false;
    }
  }

  return true;
}

bool Writer::write(const std::filesystem::path &destPath, FormatError *outError) {
  std::filesystem::path tempPath = destPath;
  tempPath += ".partial";

  // Output files are truncated before sources are read, so neither may be a source
  std::error_code ec;
  for (const auto &pending : pendingFiles_) {
    if (!pending.fromDisk) {
      continue;
    }
    if (std::filesystem::equivalent(destPath, pending.sourcePath, ec) ||
        std::filesystem::equivalent(tempPath, pending.sourcePath, ec)) {
      setError(outError, FormatErrorKind::Io, 0,
               std::format("Destination is also the source of entry '{}': {}", pending.name,
                           destPath.string()));
      return false;
    }
  }

  auto layout = plan(outError);
  if (!layout) {
    return false;
  }

  // Build beside the destination and rename into place once complete
  MappedFile outputFile;
  bool written = outputFile.openWrite(tempPath, layout->totalSize, outError) &&
                 emit(*layout, outputFile.data(), outError) && outputFile.flush(outError);
  outputFile.close();

  if (written) {
    std::filesystem::rename(tempPath, destPath, ec);
    if (ec) {
      setError(outError, FormatErrorKind::Io, 0,
               std::format("Failed to move {} into place: {}", destPath.string(), ec.message()));
      written = false;
    }
  }

  if (!written) {
    std::filesystem::remove(tempPath, ec);
    return false;
  }

  written_ = std::move(layout->descriptors);
  return true;
}

std::optional<std::vector<uint8_t>> Writer::toBuffer(FormatError *outError) {
  auto layout = plan(outError);
  if (!layout) {
    return std::nullopt;
  }

  std::vector<uint8_t> output(layout->totalSize);
  if (!emit(*layout, output, outError)) {
    return std::nullopt;
  }

  written_ = std::move(layout->descriptors);
  return output;
}

void Writer::clear() {
  pendingFiles_.clear();
  written_.clear();
}

} // namespace brarchive
