#include <algorithm>
#include <iterator>
#include <random>
#include <string>
#include <vector>

#include <brarchive/decoder.hpp>
#include <brarchive/encoder.hpp>

#include <gtest/gtest.h>

#include "test_helpers.hpp"

using brarchive::ArchiveEntry;
using brarchive::EntryMap;
using brarchive::FormatError;
using testutil::toBytes;

namespace {

// Random valid name: ASCII path characters mixed with 2-, 3- and 4-byte sequences
std::string randomName(std::mt19937 &rng) {
  static const char *const pieces[] = {"a",  "Z",        "0",           "/",
                                       ".",  "_",        "\xC3\xA9",    "\xED\x95\x9C",
                                       "-",  "\xF0\x9F\x93\xA6"};
  std::uniform_int_distribution<int> pieceCount(0, 40);
  std::uniform_int_distribution<size_t> pick(0, std::size(pieces) - 1);

  std::string name;
  for (int i = pieceCount(rng); i > 0; --i) {
    std::string piece = pieces[pick(rng)];
    if (name.size() + piece.size() > brarchive::format::entryNameLenMax) {
      break;
    }
    name += piece;
  }
  return name;
}

EntryMap randomEntries(std::mt19937 &rng, size_t count) {
  std::uniform_int_distribution<size_t> length(0, 300);
  std::uniform_int_distribution<int> byte(0, 255);

  EntryMap entries;
  while (entries.size() < count) {
    std::vector<uint8_t> content(length(rng));
    std::generate(content.begin(), content.end(), [&] { return static_cast<uint8_t>(byte(rng)); });
    entries.insert_or_assign(randomName(rng), std::move(content));
  }
  return entries;
}

} // namespace

TEST(RoundTripTest, RandomMappingsSurviveEncodeDecode) {
  std::mt19937 rng(0xB12A);

  for (size_t count : {0u, 1u, 2u, 7u, 64u}) {
    EntryMap entries = randomEntries(rng, count);

    FormatError error;
    auto buffer = brarchive::encode(entries, &error);
    ASSERT_TRUE(buffer.has_value()) << error.message;

    auto decoded = brarchive::decode(*buffer, &error);
    ASSERT_TRUE(decoded.has_value()) << error.message;

    EXPECT_EQ(decoded->entries, entries) << "count " << count;
    EXPECT_EQ(decoded->entryCount, entries.size());
    EXPECT_EQ(decoded->version, 1);
  }
}

TEST(RoundTripTest, BoundaryNamesAndBinaryContent) {
  std::vector<uint8_t> allBytes(256);
  for (size_t i = 0; i < allBytes.size(); ++i) {
    allBytes[i] = static_cast<uint8_t>(i);
  }

  EntryMap entries = {
      {"", {}},
      {std::string(247, 'x'), toBytes("long name")},
      {"bin/all_bytes", allBytes},
      {std::string("nul\0inside", 10), toBytes("ok")},
      {"manifest.json", toBytes("{\"format_version\": 2}")},
  };

  auto buffer = brarchive::encode(entries);
  ASSERT_TRUE(buffer.has_value());

  auto decoded = brarchive::decode(*buffer);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->entries, entries);
}

TEST(RoundTripTest, EncodingIsIndependentOfInsertionOrder) {
  std::mt19937 rng(7);
  EntryMap entries = randomEntries(rng, 20);

  std::vector<ArchiveEntry> sequence;
  for (const auto &[name, content] : entries) {
    sequence.push_back({name, content});
  }

  auto fromMap = brarchive::encode(entries);
  ASSERT_TRUE(fromMap.has_value());

  for (int round = 0; round < 5; ++round) {
    std::shuffle(sequence.begin(), sequence.end(), rng);

    auto fromSequence = brarchive::encode(sequence);
    ASSERT_TRUE(fromSequence.has_value());
    EXPECT_EQ(*fromSequence, *fromMap) << "round " << round;
  }

  auto again = brarchive::encode(entries);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(*again, *fromMap);
}

TEST(RoundTripTest, EncoderOutputIsContiguousAndSorted) {
  std::mt19937 rng(99);
  EntryMap entries = randomEntries(rng, 30);

  auto buffer = brarchive::encode(entries);
  ASSERT_TRUE(buffer.has_value());

  auto layout = brarchive::readDescriptors(*buffer);
  ASSERT_TRUE(layout.has_value());

  uint64_t expectedOffset = 0;
  for (size_t i = 0; i < layout->descriptors.size(); ++i) {
    const auto &descriptor = layout->descriptors[i];
    if (i > 0) {
      EXPECT_LT(layout->descriptors[i - 1].name, descriptor.name);
    }
    EXPECT_EQ(descriptor.contentsOffset, expectedOffset);
    expectedOffset += descriptor.contentsLen;
  }
  EXPECT_EQ(layout->contentStart + expectedOffset, buffer->size());
}

TEST(RoundTripTest, TruncatingAnyTrailingByteIsDetected) {
  EntryMap entries = {{"a.txt", toBytes("hi")}, {"b.txt", toBytes("bye")}};
  auto buffer = brarchive::encode(entries);
  ASSERT_TRUE(buffer.has_value());

  // Every cut inside the descriptor table or content region must fail cleanly
  for (size_t size = 0; size < buffer->size(); ++size) {
    std::span<const uint8_t> prefix(buffer->data(), size);

    FormatError error;
    EXPECT_FALSE(brarchive::decode(prefix, &error).has_value()) << "size " << size;
    EXPECT_EQ(error.kind, brarchive::FormatErrorKind::TruncatedBuffer) << "size " << size;
  }
}
