/**
 * @file utf8_test.cpp
 * @brief Tests for UTF-8 display width and padding used by column alignment.
 */

#include "tabedit/utf8.h"

#include <gtest/gtest.h>

using namespace tabedit;

class Utf8Test : public ::testing::Test {};

// =============================================================================
// UTF-8 Decode Tests
// =============================================================================

TEST_F(Utf8Test, DecodeAscii) {
  uint32_t cp;
  std::string_view str = "AB";

  EXPECT_EQ(utf8_decode(str, 0, cp), 1);
  EXPECT_EQ(cp, 'A');

  EXPECT_EQ(utf8_decode(str, 1, cp), 1);
  EXPECT_EQ(cp, 'B');
}

TEST_F(Utf8Test, DecodeMultibyteSequences) {
  uint32_t cp;

  // ä (U+00E4) is encoded as C3 A4
  EXPECT_EQ(utf8_decode("ä", 0, cp), 2);
  EXPECT_EQ(cp, 0x00E4);

  // 表 (U+8868) is encoded as E8 A1 A8
  EXPECT_EQ(utf8_decode("表", 0, cp), 3);
  EXPECT_EQ(cp, 0x8868);

  // 🎉 (U+1F389) is encoded as F0 9F 8E 89
  EXPECT_EQ(utf8_decode("🎉", 0, cp), 4);
  EXPECT_EQ(cp, 0x1F389);
}

TEST_F(Utf8Test, DecodeInvalidBytesYieldReplacement) {
  uint32_t cp;

  EXPECT_EQ(utf8_decode(std::string("\x80"), 0, cp), 1);
  EXPECT_EQ(cp, 0xFFFD);

  // Truncated 3-byte sequence
  EXPECT_EQ(utf8_decode(std::string("\xE8\xA1"), 0, cp), 1);
  EXPECT_EQ(cp, 0xFFFD);

  // Overlong encoding of '/'
  EXPECT_EQ(utf8_decode(std::string("\xC0\xAF"), 0, cp), 2);
  EXPECT_EQ(cp, 0xFFFD);
}

TEST_F(Utf8Test, DecodePastEndConsumesNothing) {
  uint32_t cp;
  EXPECT_EQ(utf8_decode("a", 1, cp), 0);
}

// =============================================================================
// Codepoint Width Tests
// =============================================================================

TEST_F(Utf8Test, CodepointWidthAsciiAndControl) {
  EXPECT_EQ(codepoint_width('x'), 1);
  EXPECT_EQ(codepoint_width(' '), 1);
  EXPECT_EQ(codepoint_width('\t'), 0);
  EXPECT_EQ(codepoint_width(0x7F), 0);
  EXPECT_EQ(codepoint_width(0x85), 0);
}

TEST_F(Utf8Test, CodepointWidthWide) {
  EXPECT_EQ(codepoint_width(0x8868), 2);   // CJK ideograph
  EXPECT_EQ(codepoint_width(0x3042), 2);   // Hiragana
  EXPECT_EQ(codepoint_width(0xAC00), 2);   // Hangul syllable
  EXPECT_EQ(codepoint_width(0xFF21), 2);   // Fullwidth A
  EXPECT_EQ(codepoint_width(0x1F389), 2);  // Emoji
  EXPECT_EQ(codepoint_width(0x20000), 2);  // CJK Extension B
}

TEST_F(Utf8Test, CodepointWidthZeroWidth) {
  EXPECT_EQ(codepoint_width(0x0301), 0);  // Combining acute accent
  EXPECT_EQ(codepoint_width(0x200B), 0);  // Zero width space
  EXPECT_EQ(codepoint_width(0x2060), 0);  // Word joiner
  EXPECT_EQ(codepoint_width(0x20D7), 0);  // Combining mark for symbols
  EXPECT_EQ(codepoint_width(0xFEFF), 0);  // BOM
}

TEST_F(Utf8Test, CodepointWidthRangeBoundaries) {
  EXPECT_EQ(codepoint_width(0x02FF), 1);
  EXPECT_EQ(codepoint_width(0x0300), 0);
  EXPECT_EQ(codepoint_width(0x036F), 0);
  EXPECT_EQ(codepoint_width(0x0370), 1);
  EXPECT_EQ(codepoint_width(0x4DFF), 2);
  EXPECT_EQ(codepoint_width(0xA4D0), 1);
}

// =============================================================================
// Display Width Tests
// =============================================================================

TEST_F(Utf8Test, DisplayWidth) {
  EXPECT_EQ(utf8_display_width(""), 0);
  EXPECT_EQ(utf8_display_width("Alice"), 5);
  EXPECT_EQ(utf8_display_width("Müller"), 6);
  EXPECT_EQ(utf8_display_width("東京"), 4);
  EXPECT_EQ(utf8_display_width("a🎉b"), 4);
  // e + combining acute accent
  EXPECT_EQ(utf8_display_width("e\xCC\x81"), 1);
}

// =============================================================================
// Padding Tests
// =============================================================================

TEST_F(Utf8Test, PadToWidthCountsDisplayColumns) {
  EXPECT_EQ(pad_to_width("ab", 5), "ab   ");
  EXPECT_EQ(pad_to_width("東京", 5), "東京 ");
  EXPECT_EQ(pad_to_width("Müller", 6), "Müller");
}

TEST_F(Utf8Test, PadToWidthNeverTruncates) {
  EXPECT_EQ(pad_to_width("abcdef", 3), "abcdef");
  EXPECT_EQ(pad_to_width("", 0), "");
}
