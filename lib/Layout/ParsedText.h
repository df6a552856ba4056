#pragma once

#include <string>
#include <vector>

#include "TextMetrics.h"

/**
 * Words of one run of inline text, broken into lines of a fixed width.
 */
class ParsedText {
  std::vector<std::string> words;
  std::vector<FontStyle> wordStyles;
  int indentPx = 0;

  std::vector<size_t> computeLineBreaksGreedy(int pageWidth, int spaceWidth, const std::vector<int>& wordWidths) const;
  std::vector<int> calculateWordWidths(const TextMetrics& metrics, float fontSize) const;
  void preSplitOversizedWords(const TextMetrics& metrics, float fontSize, int pageWidth);

 public:
  explicit ParsedText(const int indentPx = 0) : indentPx(indentPx) {}
  ~ParsedText() = default;

  void addWord(std::string word, FontStyle fontStyle);
  void setIndent(const int px) { indentPx = px; }
  size_t size() const { return words.size(); }
  bool isEmpty() const { return words.empty(); }

  /**
   * Break the words into lines no wider than viewportWidth.
   * Words wider than a line are split across lines.
   * @return number of lines (0 when empty)
   */
  size_t layoutLines(const TextMetrics& metrics, float fontSize, int viewportWidth);
};
