#include "TextMetrics.h"

#include <Utf8.h>

#include <cctype>
#include <cmath>

namespace {

constexpr float BOLD_FACTOR = 1.06f;
constexpr float SPACE_ADVANCE = 0.28f;
constexpr float NARROW_ADVANCE = 0.3f;  // i, l, punctuation
constexpr float WIDE_LATIN_ADVANCE = 0.8f;  // m, w, capitals

bool isNarrow(uint32_t cp) {
  return cp == 'i' || cp == 'l' || cp == 'j' || cp == 't' || cp == 'f' || cp == 'I' || cp == '.' || cp == ',' ||
         cp == ';' || cp == ':' || cp == '!' || cp == '\'' || cp == '|';
}

bool isWideLatin(uint32_t cp) { return cp == 'm' || cp == 'w' || cp == 'M' || cp == 'W' || (cp >= 'A' && cp <= 'Z'); }

}  // namespace

FontClass EstimatedTextMetrics::classify(const std::string& fontFamily) {
  std::string lower;
  lower.reserve(fontFamily.size());
  for (const char c : fontFamily) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower.find("mono") != std::string::npos || lower.find("courier") != std::string::npos) {
    return FontClass::Monospace;
  }
  if (lower.find("serif") != std::string::npos && lower.find("sans") == std::string::npos) {
    return FontClass::Serif;
  }
  if (lower.find("georgia") != std::string::npos || lower.find("times") != std::string::npos ||
      lower.find("song") != std::string::npos) {
    return FontClass::Serif;
  }
  return FontClass::SansSerif;
}

float EstimatedTextMetrics::averageAdvance() const {
  switch (fontClass_) {
    case FontClass::Monospace:
      return 0.6f;
    case FontClass::Serif:
      return 0.5f;
    case FontClass::SansSerif:
    default:
      return 0.53f;
  }
}

int EstimatedTextMetrics::getTextWidth(const char* text, const FontStyle style, const float fontSize) const {
  const bool monospace = fontClass_ == FontClass::Monospace;
  const float average = averageAdvance();
  float em = 0.0f;

  const auto* p = reinterpret_cast<const unsigned char*>(text);
  uint32_t cp;
  while ((cp = utf8NextCodepoint(&p))) {
    if (utf8IsCombiningMark(cp) || cp == 0x00AD || cp == 0x200B || cp == 0xFEFF) {
      continue;  // zero-width
    }
    if (utf8IsWide(cp)) {
      em += 1.0f;
    } else if (monospace) {
      em += average;
    } else if (cp == 0x2003) {
      em += 1.0f;  // em space
    } else if (cp == 0x2002) {
      em += 0.5f;  // en space
    } else if (isNarrow(cp)) {
      em += NARROW_ADVANCE;
    } else if (isWideLatin(cp)) {
      em += WIDE_LATIN_ADVANCE;
    } else {
      em += average;
    }
  }

  if (style == FontStyle::Bold || style == FontStyle::BoldItalic) {
    em *= BOLD_FACTOR;
  }
  return static_cast<int>(std::ceil(em * fontSize));
}

int EstimatedTextMetrics::getSpaceWidth(const float fontSize) const {
  const float advance = fontClass_ == FontClass::Monospace ? averageAdvance() : SPACE_ADVANCE;
  return static_cast<int>(std::ceil(advance * fontSize));
}
