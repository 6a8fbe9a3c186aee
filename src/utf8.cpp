/**
 * @file utf8.cpp
 * @brief Implementation of UTF-8 display width utilities.
 */

#include "tabedit/utf8.h"

#include <algorithm>
#include <iterator>

namespace tabedit {

namespace {

struct CodepointRange {
  uint32_t first;
  uint32_t last;
};

// Zero-width: combining marks and invisible joiners, sorted by start
constexpr CodepointRange kZeroWidth[] = {
    {0x0300, 0x036F},   // Combining Diacritical Marks
    {0x1AB0, 0x1AFF},   // Combining Diacritical Marks Extended
    {0x1DC0, 0x1DFF},   // Combining Diacritical Marks Supplement
    {0x200B, 0x200D},   // Zero width space, non-joiner, joiner
    {0x2060, 0x2060},   // Word joiner
    {0x20D0, 0x20FF},   // Combining Diacritical Marks for Symbols
    {0xFE20, 0xFE2F},   // Combining Half Marks
    {0xFEFF, 0xFEFF},   // Zero width no-break space (BOM)
};

// Double-width: East Asian wide/fullwidth blocks and emoji, sorted by start
constexpr CodepointRange kWide[] = {
    {0x2E80, 0x303F},   // CJK radicals, Kangxi, ideographic description, CJK symbols
    {0x3040, 0x33FF},   // Hiragana through CJK Compatibility
    {0x3400, 0x4DBF},   // CJK Unified Ideographs Extension A
    {0x4DC0, 0x4DFF},   // Yijing Hexagram Symbols
    {0x4E00, 0x9FFF},   // CJK Unified Ideographs
    {0xA000, 0xA4CF},   // Yi Syllables and Radicals
    {0xA960, 0xA97F},   // Hangul Jamo Extended-A
    {0xAC00, 0xD7FF},   // Hangul Syllables, Jamo Extended-B
    {0xF900, 0xFAFF},   // CJK Compatibility Ideographs
    {0xFE10, 0xFE1F},   // Vertical Forms
    {0xFE30, 0xFE6F},   // CJK Compatibility Forms, Small Form Variants
    {0xFF00, 0xFF60},   // Fullwidth Forms
    {0xFFE0, 0xFFE6},   // Fullwidth signs
    {0x1F300, 0x1F64F}, // Misc Symbols and Pictographs, Emoticons
    {0x1F650, 0x1F6FF}, // Ornamental Dingbats, Transport and Map
    {0x1F700, 0x1FBFF}, // Alchemical through Symbols for Legacy Computing
    {0x20000, 0x3FFFF}, // CJK Extensions B-I
};

template <size_t N>
bool in_ranges(const CodepointRange (&ranges)[N], uint32_t cp) {
  auto it = std::upper_bound(std::begin(ranges), std::end(ranges), cp,
                             [](uint32_t v, const CodepointRange& r) { return v < r.first; });
  if (it == std::begin(ranges)) {
    return false;
  }
  --it;
  return cp <= it->last;
}

} // namespace

size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint) {
  if (pos >= str.size()) {
    codepoint = 0xFFFD;
    return 0;
  }

  uint8_t byte = static_cast<uint8_t>(str[pos]);
  if ((byte & 0x80) == 0) {
    codepoint = byte;
    return 1;
  }

  size_t len;
  uint32_t cp;
  if ((byte & 0xE0) == 0xC0) {
    len = 2;
    cp = byte & 0x1F;
  } else if ((byte & 0xF0) == 0xE0) {
    len = 3;
    cp = byte & 0x0F;
  } else if ((byte & 0xF8) == 0xF0) {
    len = 4;
    cp = byte & 0x07;
  } else {
    // Stray continuation byte or invalid lead byte
    codepoint = 0xFFFD;
    return 1;
  }

  if (pos + len > str.size()) {
    codepoint = 0xFFFD;
    return 1;
  }

  for (size_t i = 1; i < len; ++i) {
    uint8_t cont = static_cast<uint8_t>(str[pos + i]);
    if ((cont & 0xC0) != 0x80) {
      codepoint = 0xFFFD;
      return 1;
    }
    cp = (cp << 6) | (cont & 0x3F);
  }

  // Overlong encodings, surrogates and out-of-range values
  bool overlong = (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
                  (len == 4 && cp < 0x10000);
  if (overlong || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    codepoint = 0xFFFD;
    return len;
  }

  codepoint = cp;
  return len;
}

int codepoint_width(uint32_t cp) {
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) {
    return 0;
  }
  if (in_ranges(kZeroWidth, cp)) {
    return 0;
  }
  if (in_ranges(kWide, cp)) {
    return 2;
  }
  return 1;
}

size_t utf8_display_width(std::string_view str) {
  size_t width = 0;
  size_t pos = 0;

  while (pos < str.size()) {
    uint32_t cp;
    size_t len = utf8_decode(str, pos, cp);
    if (len == 0)
      break;

    width += codepoint_width(cp);
    pos += len;
  }

  return width;
}

std::string pad_to_width(std::string_view str, size_t width) {
  std::string out(str);
  size_t current = utf8_display_width(str);
  if (current < width) {
    out.append(width - current, ' ');
  }
  return out;
}

} // namespace tabedit
