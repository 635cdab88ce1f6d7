#include <string>

#include <brarchive/utf8.hpp>

#include <gtest/gtest.h>

TEST(Utf8Test, AcceptsWellFormedText) {
  EXPECT_TRUE(brarchive::isValidUtf8(""));
  EXPECT_TRUE(brarchive::isValidUtf8("textures/blocks/stone.png"));
  EXPECT_TRUE(brarchive::isValidUtf8("caf\xC3\xA9"));                   // U+00E9
  EXPECT_TRUE(brarchive::isValidUtf8("\xED\x95\x9C\xEA\xB5\xAD\xEC\x96\xB4")); // Hangul
  EXPECT_TRUE(brarchive::isValidUtf8("\xF0\x9F\x93\xA6"));              // U+1F4E6
  EXPECT_TRUE(brarchive::isValidUtf8("\xEF\xBF\xBF"));                  // U+FFFF
  EXPECT_TRUE(brarchive::isValidUtf8("\xF4\x8F\xBF\xBF"));              // U+10FFFF
}

TEST(Utf8Test, EmbeddedNulIsValid) {
  EXPECT_TRUE(brarchive::isValidUtf8(std::string("a\0b", 3)));
}

TEST(Utf8Test, RejectsStrayContinuationByte) {
  auto bad = brarchive::firstInvalidUtf8("ab\x80");
  ASSERT_TRUE(bad.has_value());
  EXPECT_EQ(*bad, 2);
}

TEST(Utf8Test, RejectsOverlongForms) {
  EXPECT_FALSE(brarchive::isValidUtf8("\xC0\xAF"));
  EXPECT_FALSE(brarchive::isValidUtf8("\xC1\xBF"));
  EXPECT_FALSE(brarchive::isValidUtf8("\xE0\x80\xAF"));
  EXPECT_FALSE(brarchive::isValidUtf8("\xF0\x80\x80\xAF"));
}

TEST(Utf8Test, RejectsSurrogates) {
  EXPECT_FALSE(brarchive::isValidUtf8("\xED\xA0\x80")); // U+D800
  EXPECT_FALSE(brarchive::isValidUtf8("\xED\xBF\xBF")); // U+DFFF
}

TEST(Utf8Test, RejectsOutOfRangeCodePoints) {
  EXPECT_FALSE(brarchive::isValidUtf8("\xF4\x90\x80\x80")); // U+110000
  EXPECT_FALSE(brarchive::isValidUtf8("\xF5\x80\x80\x80"));
  EXPECT_FALSE(brarchive::isValidUtf8("\xFF"));
}

TEST(Utf8Test, RejectsTruncatedSequence) {
  auto bad = brarchive::firstInvalidUtf8("ok\xE2\x82");
  ASSERT_TRUE(bad.has_value());
  EXPECT_EQ(*bad, 2);

  EXPECT_FALSE(brarchive::isValidUtf8("\xC3"));
}

TEST(Utf8Test, RejectsBadContinuationInsideSequence) {
  auto bad = brarchive::firstInvalidUtf8("x\xE2\x82z");
  ASSERT_TRUE(bad.has_value());
  EXPECT_EQ(*bad, 1);
}
