#include <cstdint>

#include <brarchive/utf8.hpp>

namespace brarchive {

std::optional<size_t> firstInvalidUtf8(std::string_view text) noexcept {
  const auto *bytes = reinterpret_cast<const uint8_t *>(text.data());
  const size_t size = text.size();
  size_t pos = 0;

  while (pos < size) {
    uint8_t lead = bytes[pos];

    if (lead < 0x80) {
      ++pos;
      continue;
    }

    // Sequence length and the allowed range of the first continuation byte
    // (RFC 3629 table, which excludes overlongs and surrogates)
    size_t length = 0;
    uint8_t low = 0x80;
    uint8_t high = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead == 0xE0) {
      length = 3;
      low = 0xA0;
    } else if (lead >= 0xE1 && lead <= 0xEC) {
      length = 3;
    } else if (lead == 0xED) {
      length = 3;
      high = 0x9F;
    } else if (lead >= 0xEE && lead <= 0xEF) {
      length = 3;
    } else if (lead == 0xF0) {
      length = 4;
      low = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
      length = 4;
    } else if (lead == 0xF4) {
      length = 4;
      high = 0x8F;
    } else {
      return pos;
    }

    if (pos + length > size) {
      return pos;
    }

    if (bytes[pos + 1] < low || bytes[pos + 1] > high) {
      return pos;
    }

    for (size_t i = 2; i < length; ++i) {
      if ((bytes[pos + i] & 0xC0) != 0x80) {
        return pos;
      }
    }

    pos += length;
  }

  return std::nullopt;
}

} // namespace brarchive
