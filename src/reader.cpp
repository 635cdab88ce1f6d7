#include <cstring>
#include <format>
#include <fstream>
#include <system_error>

#include <brarchive/reader.hpp>

#include "error.hpp"

namespace brarchive {

using detail::setError;

namespace {

// Entry names are UTF-8; build the path from char8_t so Windows converts correctly
std::filesystem::path pathFromName(const std::string &name) {
  return std::filesystem::path(
      std::u8string(reinterpret_cast<const char8_t *>(name.data()), name.size()));
}

bool isContainedRelativePath(const std::filesystem::path &path) {
  if (path.empty() || path.has_root_name() || path.has_root_directory()) {
    return false;
  }
  for (const auto &part : path) {
    if (part == "..") {
      return false;
    }
  }
  return path.has_filename();
}

} // namespace

std::optional<Reader> Reader::open(const std::filesystem::path &path, FormatError *outError,
                                   const DecodeOptions &options) {
  Reader reader;
  reader.options_ = options;

  if (!reader.mappedFile_.openRead(path, outError)) {
    return std::nullopt;
  }

  if (!reader.index(outError)) {
    reader.close();
    return std::nullopt;
  }

  return reader;
}

bool Reader::index(FormatError *outError) {
  auto data = mappedFile_.data();

  auto layout = readDescriptors(data, outError);
  if (!layout) {
    return false;
  }
  layout_ = std::move(*layout);

  lookup_.reserve(layout_.descriptors.size());
  for (size_t i = 0; i < layout_.descriptors.size(); ++i) {
    const auto &entry = layout_.descriptors[i];

    if (!sliceContent(data, layout_, entry, outError)) {
      return false;
    }

    if (options_.duplicates == DuplicatePolicy::Reject && lookup_.contains(entry.name)) {
      setError(outError, FormatErrorKind::DuplicateName, 0,
               std::format("Duplicate entry name in archive: {}", entry.name));
      return false;
    }

    lookup_.insert_or_assign(entry.name, i);
  }

  return true;
}

const EntryDescriptor *Reader::findEntry(const std::string &name) const {
  auto it = lookup_.find(name);
  if (it == lookup_.end()) {
    return nullptr;
  }
  return &layout_.descriptors[it->second];
}

std::span<const uint8_t> Reader::getEntryView(const EntryDescriptor &entry) const {
  auto view = sliceContent(mappedFile_.data(), layout_, entry);
  if (!view) {
    return {};
  }
  return *view;
}

std::optional<std::vector<uint8_t>> Reader::extractToMemory(const EntryDescriptor &entry,
                                                            FormatError *outError) const {
  auto view = sliceContent(mappedFile_.data(), layout_, entry, outError);
  if (!view) {
    return std::nullopt;
  }
  return std::vector<uint8_t>(view->begin(), view->end());
}

bool Reader::extract(const EntryDescriptor &entry, const std::filesystem::path &destRoot,
                     FormatError *outError) const {
  auto relative = pathFromName(entry.name).lexically_normal();
  if (!isContainedRelativePath(relative)) {
    setError(outError, FormatErrorKind::Io, 0,
             std::format("Refusing to extract entry outside the destination: '{}'",
                         entry.name));
    return false;
  }

  auto view = sliceContent(mappedFile_.data(), layout_, entry, outError);
  if (!view) {
    return false;
  }

  std::filesystem::path destPath = destRoot / relative;

  std::error_code ec;
  std::filesystem::create_directories(destPath.parent_path(), ec);
  if (ec) {
    setError(outError, FormatErrorKind::Io, 0,
             std::format("Failed to create directory {}: {}", destPath.parent_path().string(),
                         ec.message()));
    return false;
  }

  std::ofstream out(destPath, std::ios::binary);
  if (!out) {
    setError(outError, FormatErrorKind::Io, 0,
             std::format("Failed to create output file: {}", destPath.string()));
    return false;
  }

  out.write(reinterpret_cast<const char *>(view->data()),
            static_cast<std::streamsize>(view->size()));
  if (!out) {
    setError(outError, FormatErrorKind::Io, 0,
             std::format("Failed to write to output file: {}", destPath.string()));
    return false;
  }

  return true;
}

std::optional<DecodedArchive> Reader::decodeAll(FormatError *outError) const {
  if (!isOpen()) {
    setError(outError, FormatErrorKind::Io, 0, "Archive not open for reading");
    return std::nullopt;
  }
  return decode(mappedFile_.data(), outError, options_);
}

bool Reader::isOpen() const {
  return mappedFile_.isOpen();
}

void Reader::close() {
  mappedFile_.close();
  layout_ = ArchiveLayout{};
  lookup_.clear();
}

} // namespace brarchive
