/**
 * @file utf8.cpp
 * @brief Implementation of UTF-8 display helpers.
 */

#include "csvlint/utf8.h"

namespace csvlint {

size_t utf8_decode(std::string_view str, size_t pos, uint32_t& codepoint) {
  if (pos >= str.size()) {
    codepoint = 0xFFFD; // Replacement character
    return 0;
  }

  uint8_t byte = static_cast<uint8_t>(str[pos]);

  // ASCII (0xxxxxxx)
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
    // Continuation byte or invalid lead
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

  // Overlong forms, surrogates and values past U+10FFFF still consume the
  // whole sequence so callers stay on a boundary.
  if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
      (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
    codepoint = 0xFFFD;
    return len;
  }

  codepoint = cp;
  return len;
}

std::string utf8_truncate(std::string_view str, size_t max_bytes) {
  if (str.size() <= max_bytes) {
    return std::string(str);
  }

  constexpr size_t ELLIPSIS_LEN = 3;
  const bool with_ellipsis = max_bytes > ELLIPSIS_LEN;
  const size_t budget = with_ellipsis ? max_bytes - ELLIPSIS_LEN : max_bytes;

  size_t pos = 0;
  while (pos < str.size()) {
    uint32_t cp;
    size_t len = utf8_decode(str, pos, cp);
    if (len == 0 || pos + len > budget)
      break;
    pos += len;
  }

  std::string out(str.substr(0, pos));
  if (with_ellipsis)
    out += "...";
  return out;
}

std::string escape_for_display(std::string_view str) {
  static const char HEX[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(str.size());
  for (char ch : str) {
    uint8_t c = static_cast<uint8_t>(ch);
    switch (c) {
    case '\r':
      out += "\\r";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20 || c == 0x7F) {
        out += "\\x";
        out += HEX[c >> 4];
        out += HEX[c & 0x0F];
      } else {
        out += ch;
      }
    }
  }
  return out;
}

} // namespace csvlint
