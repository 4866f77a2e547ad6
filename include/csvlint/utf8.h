/**
 * @file utf8.h
 * @brief UTF-8 helpers for rendering record text in defect reports.
 *
 * Context snippets attached to defects must stay readable on a terminal and
 * must never end in the middle of a multi-byte sequence, even though the
 * record they come from may be arbitrarily long.
 *
 * @see utf8_truncate() for cutting at code point boundaries
 * @see escape_for_display() for making line breaks and control bytes visible
 */

#ifndef CSVLINT_UTF8_H
#define CSVLINT_UTF8_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace csvlint {

/**
 * @brief Decode a UTF-8 sequence starting at the given position.
 *
 * @param str The UTF-8 string
 * @param pos Starting byte position
 * @param[out] codepoint The decoded code point (0xFFFD for invalid sequences)
 * @return The number of bytes consumed (1-4, 1 for an invalid lead byte, 0 at end)
 */
size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint);

/**
 * @brief Truncate a UTF-8 string to at most max_bytes bytes.
 *
 * Cuts at a code point boundary. If truncation occurs and there is room,
 * "..." is appended and counted against max_bytes.
 */
std::string utf8_truncate(std::string_view str, size_t max_bytes);

/**
 * @brief Escape CR, LF, TAB and other control bytes as \r, \n, \t, \xNN.
 *
 * Bytes >= 0x80 are passed through unchanged.
 */
std::string escape_for_display(std::string_view str);

} // namespace csvlint

#endif // CSVLINT_UTF8_H
