#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <brarchive/types.hpp>

// Internal helpers shared by the decoder, encoder and file I/O
namespace brarchive::detail {

inline void setError(FormatError *outError, FormatErrorKind kind, size_t offset,
                     std::string message) {
  if (outError) {
    outError->kind = kind;
    outError->offset = offset;
    outError->message = std::move(message);
  }
}

// Length and encoding checks applied to every entry name on encode
bool checkEntryName(std::string_view name, FormatError *outError);

} // namespace brarchive::detail
