#include "Utf8.h"

namespace {

constexpr uint32_t REPLACEMENT_CHAR = 0xFFFD;

int sequenceLength(const unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 0;
}

}  // namespace

uint32_t utf8NextCodepoint(const unsigned char** string) {
  const unsigned char* s = *string;
  if (*s == 0) {
    return 0;
  }

  const int bytes = sequenceLength(*s);
  if (bytes == 0) {
    *string = s + 1;
    return REPLACEMENT_CHAR;
  }
  if (bytes == 1) {
    *string = s + 1;
    return *s;
  }

  uint32_t cp = *s & (0xFF >> (bytes + 1));
  for (int i = 1; i < bytes; i++) {
    if ((s[i] & 0xC0) != 0x80) {
      // Truncated sequence: resync on the offending byte
      *string = s + i;
      return REPLACEMENT_CHAR;
    }
    cp = (cp << 6) | (s[i] & 0x3F);
  }
  *string = s + bytes;
  return cp;
}

size_t utf8CodepointCount(const std::string& str) {
  size_t count = 0;
  for (const char ch : str) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80) {
      count++;
    }
  }
  return count;
}

std::string utf8Prefix(const std::string& str, const size_t numChars) {
  size_t seen = 0;
  for (size_t i = 0; i < str.size(); i++) {
    if ((static_cast<unsigned char>(str[i]) & 0xC0) != 0x80) {
      if (seen == numChars) {
        return str.substr(0, i);
      }
      seen++;
    }
  }
  return str;
}

size_t utf8RemoveLastChar(std::string& str) {
  if (str.empty()) {
    return 0;
  }
  size_t pos = str.size() - 1;
  // Walk back over continuation bytes to the lead byte
  while (pos > 0 && (static_cast<unsigned char>(str[pos]) & 0xC0) == 0x80) {
    --pos;
  }
  str.resize(pos);
  return pos;
}
