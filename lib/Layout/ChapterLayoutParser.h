#pragma once

#include <CssParser.h>
#include <expat.h>

#include <climits>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "ParsedText.h"
#include "TextMetrics.h"

#define MAX_WORD_SIZE 200
constexpr int MAX_XML_DEPTH = 256;

struct LayoutConfig {
  float fontSize = 16.0f;
  float lineHeight = 1.8f;
  uint16_t viewportWidth = 0;
  uint16_t viewportHeight = 0;
  uint8_t snippetLength = 20;

  LayoutConfig() = default;
  LayoutConfig(float fontSize, float lineHeight, uint16_t viewportWidth, uint16_t viewportHeight)
      : fontSize(fontSize), lineHeight(lineHeight), viewportWidth(viewportWidth), viewportHeight(viewportHeight) {}

  bool operator==(const LayoutConfig& o) const {
    return std::abs(fontSize - o.fontSize) < 1e-6f && std::abs(lineHeight - o.lineHeight) < 1e-6f &&
           viewportWidth == o.viewportWidth && viewportHeight == o.viewportHeight && snippetLength == o.snippetLength;
  }
  bool operator!=(const LayoutConfig& o) const { return !(*this == o); }
};

// A leaf block-level element and where its first line landed
struct LayoutBlock {
  uint32_t pageInChapter = 0;
  uint32_t textOffset = 0;
  uint32_t textLength = 0;
  std::string snippet;
};

struct ChapterLayout {
  uint32_t pageCount = 1;
  uint32_t textLength = 0;
  std::vector<LayoutBlock> blocks;
};

/**
 * Lays a chapter's HTML out into columns of viewportWidth x viewportHeight,
 * filling one column before starting the next, and records the column of
 * every leaf block (p, h1-h6, div, blockquote, li, pre, figcaption, dt, dd,
 * section, article without nested blocks of those kinds).
 */
class ChapterLayoutParser {
  struct Frame {
    int depth = 0;
    bool isBlock = false;
    bool isAnchorBlock = false;  // matches the block selector
    bool hasAnchorChild = false;
    float fontSize = 16.0f;
    float marginBottom = 0.0f;
    int inset = 0;  // horizontal space taken by this and enclosing blocks
    int textIndent = 0;
    int32_t startColumn = -1;
    std::string text;
  };

  const TextMetrics& metrics;
  LayoutConfig config;
  const CssParser* cssParser_ = nullptr;

  int depth = 0;
  int skipUntilDepth = INT_MAX;
  int boldUntilDepth = INT_MAX;
  int italicUntilDepth = INT_MAX;
  int preUntilDepth = INT_MAX;
  // buffer for building up words from characters, will auto break if longer than this
  // leave one char at end for null pointer
  char partWordBuffer[MAX_WORD_SIZE + 1] = {};
  int partWordBufferIndex = 0;
  // next flushed piece continues a word that was cut at MAX_WORD_SIZE
  bool wordContinues_ = false;
  std::unique_ptr<ParsedText> currentTextBlock = nullptr;
  bool skipNextNewline_ = false;  // first newline right after <pre>

  std::vector<Frame> frames_;
  std::string allText_;

  // Column fill state
  uint32_t column_ = 0;
  float cursorY_ = 0.0f;
  float pendingMargin_ = 0.0f;
  bool hasContent_ = false;

  ChapterLayout layout_;
  std::string errorMessage_;

  XML_Parser xmlParser_ = nullptr;

  Frame* innermostBlock();
  Frame* innermostAnchorBlock();
  float currentFontSize() const;
  int availableWidth() const;

  void flushPartWordBuffer();
  void splitPartWordBuffer(bool midSequence);
  void startNewTextBlock(int indentPx);
  void layoutTextBlock();
  void forceLineBreak();
  void placeLine(float lineHeightPx);
  void addMargin(float px);
  void closeBlock(const Frame& frame);
  void placeImage(const XML_Char** atts);
  void finish();

  // XML callbacks
  static void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts);
  static void XMLCALL characterData(void* userData, const XML_Char* s, int len);
  static void XMLCALL endElement(void* userData, const XML_Char* name);
  static void XMLCALL defaultHandler(void* userData, const XML_Char* s, int len);

  void cleanupParser();

 public:
  explicit ChapterLayoutParser(const TextMetrics& metrics, const LayoutConfig& config,
                               const CssParser* cssParser = nullptr)
      : metrics(metrics), config(config), cssParser_(cssParser) {}
  ~ChapterLayoutParser();

  ChapterLayoutParser(const ChapterLayoutParser&) = delete;
  ChapterLayoutParser& operator=(const ChapterLayoutParser&) = delete;

  /**
   * Lay out one chapter. Returns false if the markup could not be parsed;
   * errorMessage() then describes the failure.
   */
  bool parse(const std::string& html);

  const ChapterLayout& getLayout() const { return layout_; }
  const std::string& errorMessage() const { return errorMessage_; }
};
