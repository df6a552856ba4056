#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

/**
 * Decode the code point at *string and advance past it.
 * Returns 0 at the terminator. Malformed bytes decode as U+FFFD and consume one byte.
 */
uint32_t utf8NextCodepoint(const unsigned char** string);

inline bool utf8IsCombiningMark(const uint32_t cp) {
  return (cp >= 0x0300 && cp <= 0x036F) ||  // Combining Diacritical Marks
         (cp >= 0x1DC0 && cp <= 0x1DFF) ||  // Supplement
         (cp >= 0x20D0 && cp <= 0x20FF) ||  // For Symbols
         (cp >= 0xFE20 && cp <= 0xFE2F);    // Half Marks
}

// East Asian wide and fullwidth ranges (one em per glyph).
inline bool utf8IsWide(const uint32_t cp) {
  return (cp >= 0x1100 && cp <= 0x115F) || (cp >= 0x2E80 && cp <= 0xA4CF) || (cp >= 0xAC00 && cp <= 0xD7A3) ||
         (cp >= 0xF900 && cp <= 0xFAFF) || (cp >= 0xFE30 && cp <= 0xFE4F) || (cp >= 0xFF00 && cp <= 0xFF60) ||
         (cp >= 0xFFE0 && cp <= 0xFFE6) || (cp >= 0x20000 && cp <= 0x3FFFD);
}

/**
 * Number of code points in str.
 */
size_t utf8CodepointCount(const std::string& str);

/**
 * First numChars code points of str, never splitting a sequence.
 */
std::string utf8Prefix(const std::string& str, size_t numChars);

/**
 * UTF-8 safe string truncation - removes one character from the end.
 * Returns the new size after removing one UTF-8 character.
 */
size_t utf8RemoveLastChar(std::string& str);
