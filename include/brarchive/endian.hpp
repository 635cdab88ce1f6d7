#pragma once

#include <bit>
#include <cstdint>
#include <cstring>
#include <span>

namespace brarchive {

// C++20-compatible byteswap (C++23 has std::byteswap)
namespace detail {

inline constexpr uint32_t byteswap(uint32_t value) noexcept {
  return ((value & 0x000000FFu) << 24) | ((value & 0x0000FF00u) << 8) |
         ((value & 0x00FF0000u) >> 8) | ((value & 0xFF000000u) >> 24);
}

inline constexpr uint64_t byteswap(uint64_t value) noexcept {
  return (static_cast<uint64_t>(byteswap(static_cast<uint32_t>(value))) << 32) |
         byteswap(static_cast<uint32_t>(value >> 32));
}

template <typename T> inline constexpr T toLittle(T value) noexcept {
  if constexpr (std::endian::native == std::endian::big) {
    return byteswap(value);
  }
  return value;
}

} // namespace detail

// Convert little-endian to host byte order
inline constexpr uint32_t letoh32(uint32_t value) noexcept { return detail::toLittle(value); }
inline constexpr uint64_t letoh64(uint64_t value) noexcept { return detail::toLittle(value); }

// Convert host byte order to little-endian
inline constexpr uint32_t htole32(uint32_t value) noexcept { return detail::toLittle(value); }
inline constexpr uint64_t htole64(uint64_t value) noexcept { return detail::toLittle(value); }

// Unaligned little-endian field access. Callers bounds-check `pos` first.
inline uint32_t readLE32(std::span<const uint8_t> data, size_t pos) noexcept {
  uint32_t value;
  std::memcpy(&value, data.data() + pos, sizeof(value));
  return letoh32(value);
}

inline uint64_t readLE64(std::span<const uint8_t> data, size_t pos) noexcept {
  uint64_t value;
  std::memcpy(&value, data.data() + pos, sizeof(value));
  return letoh64(value);
}

inline void writeLE32(std::span<uint8_t> data, size_t pos, uint32_t value) noexcept {
  uint32_t le = htole32(value);
  std::memcpy(data.data() + pos, &le, sizeof(le));
}

inline void writeLE64(std::span<uint8_t> data, size_t pos, uint64_t value) noexcept {
  uint64_t le = htole64(value);
  std::memcpy(data.data() + pos, &le, sizeof(le));
}

} // namespace brarchive
