/**
 * @file utf8.h
 * @brief UTF-8 display width utilities used for column alignment.
 *
 * Display Width:
 * - ASCII printable characters: 1 column
 * - CJK characters (Han, Hiragana, Katakana, Hangul, etc.): 2 columns
 * - Fullwidth forms and most emoji: 2 columns
 * - Control characters, combining marks and zero-width characters: 0 columns
 * - Other characters: 1 column
 *
 * @see utf8_display_width() for calculating string display width
 * @see pad_to_width() for right-padding a cell to a column width
 */

#ifndef TABEDIT_UTF8_H
#define TABEDIT_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace tabedit {

/**
 * @brief Decode a UTF-8 sequence starting at the given position.
 *
 * @param str The UTF-8 string
 * @param pos Starting byte position
 * @param[out] codepoint The decoded code point (set to 0xFFFD for invalid sequences)
 * @return The number of bytes consumed (1-4; a bad lead or continuation byte
 *         consumes 1, 0 at end of string)
 */
size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint);

/**
 * @brief Get the display width of a Unicode code point (0, 1 or 2).
 */
int codepoint_width(uint32_t codepoint);

/**
 * @brief Calculate the display width of a UTF-8 string.
 *
 * Invalid UTF-8 sequences count as one replacement character each.
 */
size_t utf8_display_width(std::string_view str);

/**
 * @brief Right-pad a string with spaces to the given display width.
 *
 * Strings already at least `width` columns wide are returned unchanged.
 */
std::string pad_to_width(std::string_view str, size_t width);

} // namespace tabedit

#endif // TABEDIT_UTF8_H
