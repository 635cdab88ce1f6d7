#include <format>

#include <brarchive/format.hpp>
#include <brarchive/utf8.hpp>

#include "error.hpp"

namespace brarchive {

std::string_view toString(FormatErrorKind kind) noexcept {
  switch (kind) {
  case FormatErrorKind::MagicMismatch:
    return "MagicMismatch";
  case FormatErrorKind::UnsupportedVersion:
    return "UnsupportedVersion";
  case FormatErrorKind::NameTooLong:
    return "NameTooLong";
  case FormatErrorKind::InvalidUtf8:
    return "InvalidUtf8";
  case FormatErrorKind::TruncatedBuffer:
    return "TruncatedBuffer";
  case FormatErrorKind::ArchiveTooLarge:
    return "ArchiveTooLarge";
  case FormatErrorKind::DuplicateName:
    return "DuplicateName";
  case FormatErrorKind::Io:
    return "Io";
  }
  return "Unknown";
}

namespace detail {

bool checkEntryName(std::string_view name, FormatError *outError) {
  if (name.size() > format::entryNameLenMax) {
    setError(outError, FormatErrorKind::NameTooLong, 0,
             std::format("Entry name is {} bytes, limit is {}: {:.32}...", name.size(),
                         format::entryNameLenMax, name));
    return false;
  }

  if (auto bad = firstInvalidUtf8(name)) {
    setError(outError, FormatErrorKind::InvalidUtf8, 0,
             std::format("Entry name is not valid UTF-8 (byte {} of {})", *bad, name.size()));
    return false;
  }

  return true;
}

} // namespace detail

} // namespace brarchive
