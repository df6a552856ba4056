#include "ParsedText.h"

#include <Utf8.h>

void ParsedText::addWord(std::string word, const FontStyle fontStyle) {
  if (word.empty()) return;

  words.push_back(std::move(word));
  wordStyles.push_back(fontStyle);
}

size_t ParsedText::layoutLines(const TextMetrics& metrics, const float fontSize, const int viewportWidth) {
  if (words.empty()) {
    return 0;
  }

  const int pageWidth = viewportWidth > 1 ? viewportWidth : 1;
  preSplitOversizedWords(metrics, fontSize, pageWidth);

  const int spaceWidth = metrics.getSpaceWidth(fontSize);
  const std::vector<int> wordWidths = calculateWordWidths(metrics, fontSize);
  return computeLineBreaksGreedy(pageWidth, spaceWidth, wordWidths).size();
}

std::vector<int> ParsedText::calculateWordWidths(const TextMetrics& metrics, const float fontSize) const {
  std::vector<int> wordWidths;
  wordWidths.reserve(words.size());

  for (size_t i = 0; i < words.size(); i++) {
    int width = metrics.getTextWidth(words[i].c_str(), wordStyles[i], fontSize);
    // Indentation widens the first word of the paragraph
    if (i == 0) {
      width += indentPx;
    }
    wordWidths.push_back(width);
  }

  return wordWidths;
}

void ParsedText::preSplitOversizedWords(const TextMetrics& metrics, const float fontSize, const int pageWidth) {
  std::vector<std::string> splitWords;
  std::vector<FontStyle> splitStyles;
  splitWords.reserve(words.size());
  splitStyles.reserve(words.size());

  for (size_t i = 0; i < words.size(); i++) {
    std::string rest = words[i];
    const FontStyle style = wordStyles[i];
    const int extra = i == 0 ? indentPx : 0;

    while (metrics.getTextWidth(rest.c_str(), style, fontSize) + (splitWords.empty() ? extra : 0) > pageWidth) {
      // Longest prefix that fits, at least one character
      std::string head = rest;
      while (utf8CodepointCount(head) > 1 &&
             metrics.getTextWidth(head.c_str(), style, fontSize) + (splitWords.empty() ? extra : 0) > pageWidth) {
        utf8RemoveLastChar(head);
      }
      if (head.size() >= rest.size()) {
        break;
      }
      splitWords.push_back(head);
      splitStyles.push_back(style);
      rest.erase(0, head.size());
    }

    splitWords.push_back(std::move(rest));
    splitStyles.push_back(style);
  }

  words.swap(splitWords);
  wordStyles.swap(splitStyles);
}

std::vector<size_t> ParsedText::computeLineBreaksGreedy(const int pageWidth, const int spaceWidth,
                                                        const std::vector<int>& wordWidths) const {
  std::vector<size_t> breaks;
  const size_t n = wordWidths.size();

  if (n == 0) {
    return breaks;
  }

  int lineWidth = -spaceWidth;  // First word won't have preceding space
  for (size_t i = 0; i < n; i++) {
    const int wordWidth = wordWidths[i];

    // Check if adding this word would overflow the line
    if (lineWidth + wordWidth + spaceWidth > pageWidth && lineWidth > 0) {
      // Line ends before this word
      breaks.push_back(i);
      lineWidth = wordWidth;
    } else {
      lineWidth += wordWidth + spaceWidth;
    }
  }

  // Last line ends at the final word
  breaks.push_back(n);
  return breaks;
}
