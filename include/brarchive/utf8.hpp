#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace brarchive {

// Offset of the first byte that does not start a well-formed UTF-8 sequence,
// or std::nullopt if the whole input is valid. Overlong forms, surrogates and
// code points above U+10FFFF are rejected.
std::optional<size_t> firstInvalidUtf8(std::string_view text) noexcept;

inline bool isValidUtf8(std::string_view text) noexcept {
  return !firstInvalidUtf8(text).has_value();
}

} // namespace brarchive
