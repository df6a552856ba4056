#include "ChapterLayoutParser.h"

#include <Logging.h>
#include <Utf8.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>

#include "HtmlEntities.h"

#define TAG "CLP"

namespace {

// Elements recorded in the block map when they contain no other element of this list
const char* ANCHOR_BLOCK_TAGS[] = {"p",  "h1", "h2",  "h3",         "h4", "h5", "h6",      "div",
                                   "blockquote", "li", "pre", "figcaption", "dt", "dd", "section", "article"};
constexpr int NUM_ANCHOR_BLOCK_TAGS = sizeof(ANCHOR_BLOCK_TAGS) / sizeof(ANCHOR_BLOCK_TAGS[0]);

// Other elements that start a new line box
const char* OTHER_BLOCK_TAGS[] = {"ul",     "ol",  "dl",  "figure", "header",  "footer", "nav",  "aside",
                                  "main",   "table", "tr", "caption", "hr",    "body",   "html", "address"};
constexpr int NUM_OTHER_BLOCK_TAGS = sizeof(OTHER_BLOCK_TAGS) / sizeof(OTHER_BLOCK_TAGS[0]);

const char* BOLD_TAGS[] = {"b", "strong"};
constexpr int NUM_BOLD_TAGS = sizeof(BOLD_TAGS) / sizeof(BOLD_TAGS[0]);

const char* ITALIC_TAGS[] = {"i", "em"};
constexpr int NUM_ITALIC_TAGS = sizeof(ITALIC_TAGS) / sizeof(ITALIC_TAGS[0]);

const char* SKIP_TAGS[] = {"head", "script", "style", "title"};
constexpr int NUM_SKIP_TAGS = sizeof(SKIP_TAGS) / sizeof(SKIP_TAGS[0]);

// Browser default styles for block elements
struct UaBlockStyle {
  const char* tag;
  float fontScale;
  float marginEm;
  int insetLeft;
  int insetRight;
  bool bold;
};

const UaBlockStyle UA_BLOCK_STYLES[] = {
    {"h1", 2.0f, 0.67f, 0, 0, true},        {"h2", 1.5f, 0.83f, 0, 0, true},  {"h3", 1.17f, 1.0f, 0, 0, true},
    {"h4", 1.0f, 1.33f, 0, 0, true},        {"h5", 0.83f, 1.67f, 0, 0, true}, {"h6", 0.67f, 2.33f, 0, 0, true},
    {"p", 1.0f, 1.0f, 0, 0, false},         {"blockquote", 1.0f, 1.0f, 40, 40, false},
    {"figure", 1.0f, 1.0f, 40, 40, false},  {"ul", 1.0f, 1.0f, 40, 0, false}, {"ol", 1.0f, 1.0f, 40, 0, false},
    {"dl", 1.0f, 1.0f, 0, 0, false},        {"pre", 1.0f, 1.0f, 0, 0, false}, {"dd", 1.0f, 0.0f, 40, 0, false},
};

bool isWhitespace(const char c) { return c == ' ' || c == '\r' || c == '\n' || c == '\t'; }

bool isUtf8Continuation(const char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

// given the start and end of a tag, check to see if it matches a known tag
bool matches(const char* tag_name, const char* possible_tags[], const int possible_tag_count) {
  for (int i = 0; i < possible_tag_count; i++) {
    if (strcmp(tag_name, possible_tags[i]) == 0) {
      return true;
    }
  }
  return false;
}

const UaBlockStyle* findUaStyle(const char* tag_name) {
  for (const auto& style : UA_BLOCK_STYLES) {
    if (strcmp(tag_name, style.tag) == 0) {
      return &style;
    }
  }
  return nullptr;
}

const char* findAttribute(const XML_Char** atts, const char* name) {
  if (atts == nullptr) return nullptr;
  for (int i = 0; atts[i]; i += 2) {
    if (strcmp(atts[i], name) == 0) {
      return atts[i + 1];
    }
  }
  return nullptr;
}

}  // namespace

ChapterLayoutParser::Frame* ChapterLayoutParser::innermostBlock() {
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    if (it->isBlock) return &*it;
  }
  return nullptr;
}

ChapterLayoutParser::Frame* ChapterLayoutParser::innermostAnchorBlock() {
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    if (it->isAnchorBlock) return &*it;
  }
  return nullptr;
}

float ChapterLayoutParser::currentFontSize() const {
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    if (it->isBlock) return it->fontSize;
  }
  return config.fontSize;
}

int ChapterLayoutParser::availableWidth() const {
  int inset = 0;
  for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
    if (it->isBlock) {
      inset = it->inset;
      break;
    }
  }
  // Deep nesting never squeezes text below a quarter of the viewport
  return std::max(static_cast<int>(config.viewportWidth) / 4, static_cast<int>(config.viewportWidth) - inset);
}

void ChapterLayoutParser::flushPartWordBuffer() {
  if (!currentTextBlock || partWordBufferIndex == 0) {
    partWordBufferIndex = 0;
    return;
  }

  const bool isBold = boldUntilDepth < depth;
  const bool isItalic = italicUntilDepth < depth;

  FontStyle fontStyle = FontStyle::Regular;
  if (isBold && isItalic) {
    fontStyle = FontStyle::BoldItalic;
  } else if (isBold) {
    fontStyle = FontStyle::Bold;
  } else if (isItalic) {
    fontStyle = FontStyle::Italic;
  }

  partWordBuffer[partWordBufferIndex] = '\0';
  const std::string word(partWordBuffer, partWordBufferIndex);
  partWordBufferIndex = 0;
  const bool joined = wordContinues_;
  wordContinues_ = false;

  // Whitespace-normalized text: words joined by single spaces, cut pieces joined by nothing
  if (Frame* anchor = innermostAnchorBlock()) {
    if (!joined && !anchor->text.empty()) anchor->text += ' ';
    anchor->text += word;
  }
  if (!joined && !allText_.empty()) allText_ += ' ';
  allText_ += word;

  currentTextBlock->addWord(word, fontStyle);
}

// Cut an over-long word at a code point boundary; the tail of a split sequence moves to the next piece
void ChapterLayoutParser::splitPartWordBuffer(const bool midSequence) {
  int cut = partWordBufferIndex;
  if (midSequence) {
    // At most three bytes of a four-byte sequence are already buffered
    while (cut > partWordBufferIndex - 3 && cut > 0 && isUtf8Continuation(partWordBuffer[cut - 1])) cut--;
    if (cut > 0 && (static_cast<unsigned char>(partWordBuffer[cut - 1]) & 0xC0) == 0xC0) {
      cut--;
    } else {
      cut = partWordBufferIndex;  // not valid UTF-8, cut where we are
    }
  }

  char carry[4];
  const int carryLen = partWordBufferIndex - cut;
  memcpy(carry, partWordBuffer + cut, carryLen);
  partWordBufferIndex = cut;
  flushPartWordBuffer();

  memcpy(partWordBuffer, carry, carryLen);
  partWordBufferIndex = carryLen;
  wordContinues_ = true;
}

// start a new text block if needed
void ChapterLayoutParser::startNewTextBlock(const int indentPx) {
  if (currentTextBlock) {
    // already have a text block running and it is empty - just reuse it
    if (currentTextBlock->isEmpty()) {
      currentTextBlock->setIndent(indentPx);
      return;
    }

    layoutTextBlock();
  }
  currentTextBlock.reset(new ParsedText(indentPx));
}

void ChapterLayoutParser::layoutTextBlock() {
  if (!currentTextBlock || currentTextBlock->isEmpty()) {
    return;
  }

  const float fontSize = currentFontSize();
  const size_t lines = currentTextBlock->layoutLines(metrics, fontSize, availableWidth());
  for (size_t i = 0; i < lines; i++) {
    placeLine(fontSize * config.lineHeight);
  }
  currentTextBlock.reset(new ParsedText(0));
}

void ChapterLayoutParser::forceLineBreak() {
  flushPartWordBuffer();
  if (currentTextBlock && currentTextBlock->isEmpty()) {
    // A break on an empty line leaves a blank line
    placeLine(currentFontSize() * config.lineHeight);
    return;
  }
  layoutTextBlock();
}

void ChapterLayoutParser::placeLine(const float lineHeightPx) {
  // Margins collapse into the pending one and vanish at the top of a column
  float margin = cursorY_ > 0.0f ? pendingMargin_ : 0.0f;
  if (cursorY_ > 0.0f && cursorY_ + margin + lineHeightPx > static_cast<float>(config.viewportHeight)) {
    column_++;
    cursorY_ = 0.0f;
    margin = 0.0f;
  }
  cursorY_ += margin + lineHeightPx;
  pendingMargin_ = 0.0f;
  hasContent_ = true;

  for (auto& frame : frames_) {
    if (frame.isAnchorBlock && frame.startColumn < 0) {
      frame.startColumn = static_cast<int32_t>(column_);
    }
  }
}

void ChapterLayoutParser::addMargin(const float px) {
  if (px > pendingMargin_) {
    pendingMargin_ = px;
  }
}

void ChapterLayoutParser::closeBlock(const Frame& frame) {
  addMargin(frame.marginBottom);

  if (!frame.isAnchorBlock || frame.hasAnchorChild) {
    return;
  }

  LayoutBlock block;
  block.pageInChapter = frame.startColumn >= 0 ? static_cast<uint32_t>(frame.startColumn) : column_;
  block.textOffset = layout_.textLength;
  block.textLength = static_cast<uint32_t>(utf8CodepointCount(frame.text));
  block.snippet = utf8Prefix(frame.text, config.snippetLength);
  layout_.textLength += block.textLength;
  layout_.blocks.push_back(std::move(block));
}

void ChapterLayoutParser::placeImage(const XML_Char** atts) {
  const char* heightAttr = findAttribute(atts, "height");
  if (heightAttr == nullptr) {
    return;
  }
  const int height = atoi(heightAttr);
  // Skip tiny decorative images (e.g. 1px-tall line separators)
  if (height <= 3) {
    return;
  }

  flushPartWordBuffer();
  layoutTextBlock();
  placeLine(static_cast<float>(std::min(height, static_cast<int>(config.viewportHeight))));
}

void XMLCALL ChapterLayoutParser::startElement(void* userData, const XML_Char* name, const XML_Char** atts) {
  auto* self = static_cast<ChapterLayoutParser*>(userData);

  // Prevent stack overflow from deeply nested XML
  if (self->depth >= MAX_XML_DEPTH) {
    XML_StopParser(self->xmlParser_, XML_FALSE);
    return;
  }

  // Middle of skip
  if (self->skipUntilDepth < self->depth) {
    self->depth += 1;
    return;
  }

  if (matches(name, SKIP_TAGS, NUM_SKIP_TAGS)) {
    // start skip
    self->skipUntilDepth = self->depth;
    self->depth += 1;
    return;
  }

  // Skip blocks with role="doc-pagebreak" and epub:type="pagebreak"
  const char* role = findAttribute(atts, "role");
  const char* epubType = findAttribute(atts, "epub:type");
  if ((role && strcmp(role, "doc-pagebreak") == 0) || (epubType && strcmp(epubType, "pagebreak") == 0)) {
    self->skipUntilDepth = self->depth;
    self->depth += 1;
    return;
  }

  // Query CSS for combined style (tag + classes + inline)
  CssStyle cssStyle;
  const char* classAttr = findAttribute(atts, "class");
  if (self->cssParser_) {
    cssStyle = self->cssParser_->getCombinedStyle(name, classAttr ? classAttr : "");
  }
  // Inline styles override stylesheet rules
  const char* styleAttr = findAttribute(atts, "style");
  if (styleAttr && styleAttr[0] != '\0') {
    cssStyle.merge(CssParser::parseInlineStyle(styleAttr));
  }

  if (cssStyle.hasDisplay && cssStyle.display == CssDisplay::None) {
    self->skipUntilDepth = self->depth;
    self->depth += 1;
    return;
  }

  const Frame* parent = self->frames_.empty() ? nullptr : &self->frames_.back();
  const float parentFontSize = parent ? parent->fontSize : self->config.fontSize;
  const float rootFontSize = self->config.fontSize;
  const auto containerWidth = static_cast<float>(self->availableWidth());
  const UaBlockStyle* ua = findUaStyle(name);

  Frame frame;
  frame.depth = self->depth;
  frame.inset = parent ? parent->inset : 0;
  frame.isBlock = ua != nullptr || matches(name, ANCHOR_BLOCK_TAGS, NUM_ANCHOR_BLOCK_TAGS) ||
                  matches(name, OTHER_BLOCK_TAGS, NUM_OTHER_BLOCK_TAGS);
  if (cssStyle.hasDisplay) {
    frame.isBlock = cssStyle.display == CssDisplay::Block;
  }
  frame.isAnchorBlock = frame.isBlock && matches(name, ANCHOR_BLOCK_TAGS, NUM_ANCHOR_BLOCK_TAGS);

  frame.fontSize = parentFontSize * (ua ? ua->fontScale : 1.0f);
  if (cssStyle.hasFontSize) {
    const float px = cssStyle.fontSize.toPx(parentFontSize, rootFontSize, parentFontSize);
    if (px > 0.0f) frame.fontSize = px;
  }

  float marginTop = ua ? ua->marginEm * frame.fontSize : 0.0f;
  frame.marginBottom = marginTop;
  if (cssStyle.hasMarginTop) {
    marginTop = cssStyle.marginTop.toPx(frame.fontSize, rootFontSize, containerWidth);
  }
  if (cssStyle.hasMarginBottom) {
    frame.marginBottom = cssStyle.marginBottom.toPx(frame.fontSize, rootFontSize, containerWidth);
  }
  if (cssStyle.hasTextIndent) {
    frame.textIndent = static_cast<int>(cssStyle.textIndent.toPx(frame.fontSize, rootFontSize, containerWidth));
  }
  if (frame.isBlock && ua) {
    frame.inset += ua->insetLeft + ua->insetRight;
  }

  const bool cssBold = cssStyle.hasFontWeight && cssStyle.fontWeight == CssFontWeight::Bold;
  const bool cssNotBold = cssStyle.hasFontWeight && cssStyle.fontWeight == CssFontWeight::Normal;
  if (((ua && ua->bold) || matches(name, BOLD_TAGS, NUM_BOLD_TAGS) || cssBold) && !cssNotBold) {
    self->boldUntilDepth = std::min(self->boldUntilDepth, self->depth);
  }
  if (matches(name, ITALIC_TAGS, NUM_ITALIC_TAGS) ||
      (cssStyle.hasFontStyle && cssStyle.fontStyle == CssFontStyle::Italic)) {
    self->italicUntilDepth = std::min(self->italicUntilDepth, self->depth);
  }

  if (strcmp(name, "br") == 0) {
    self->forceLineBreak();
  } else if (strcmp(name, "img") == 0) {
    self->placeImage(atts);
  }

  if (frame.isBlock) {
    self->flushPartWordBuffer();
    self->layoutTextBlock();
    if (frame.isAnchorBlock) {
      if (Frame* enclosing = self->innermostAnchorBlock()) {
        enclosing->hasAnchorChild = true;
      }
    }
    self->addMargin(marginTop);
    if (strcmp(name, "pre") == 0) {
      self->preUntilDepth = std::min(self->preUntilDepth, self->depth);
      self->skipNextNewline_ = true;
    }
    self->frames_.push_back(std::move(frame));
    self->startNewTextBlock(self->frames_.back().textIndent);
  } else {
    self->frames_.push_back(std::move(frame));
  }

  self->depth += 1;
}

void XMLCALL ChapterLayoutParser::characterData(void* userData, const XML_Char* s, const int len) {
  auto* self = static_cast<ChapterLayoutParser*>(userData);

  // Middle of skip
  if (self->skipUntilDepth < self->depth) {
    return;
  }

  // Zero Width No-Break Space / BOM (U+FEFF) = 0xEF 0xBB 0xBF
  const auto FEFF_BYTE_1 = static_cast<XML_Char>(0xEF);
  const auto FEFF_BYTE_2 = static_cast<XML_Char>(0xBB);
  const auto FEFF_BYTE_3 = static_cast<XML_Char>(0xBF);
  const bool inPre = self->preUntilDepth < self->depth;

  for (int i = 0; i < len; i++) {
    if (inPre && s[i] == '\n') {
      if (self->skipNextNewline_) {
        self->skipNextNewline_ = false;
        continue;
      }
      self->forceLineBreak();
      continue;
    }

    if (isWhitespace(s[i])) {
      // Currently looking at whitespace, if there's anything in the partWordBuffer, flush it
      if (self->partWordBufferIndex > 0) {
        self->flushPartWordBuffer();
      }
      // Skip the whitespace char
      continue;
    }
    self->skipNextNewline_ = false;

    // Skip BOM character (sometimes appears before em-dashes in EPUBs)
    if (s[i] == FEFF_BYTE_1) {
      // Check if the next two bytes complete the 3-byte sequence
      if ((i + 2 < len) && (s[i + 1] == FEFF_BYTE_2) && (s[i + 2] == FEFF_BYTE_3)) {
        i += 2;
        continue;
      }
    }

    // If we're about to run out of space, then cut the word off and start a new one
    if (self->partWordBufferIndex >= MAX_WORD_SIZE) {
      self->splitPartWordBuffer(isUtf8Continuation(s[i]));
    }

    self->partWordBuffer[self->partWordBufferIndex++] = s[i];
  }
}

void XMLCALL ChapterLayoutParser::endElement(void* userData, const XML_Char* name) {
  auto* self = static_cast<ChapterLayoutParser*>(userData);
  (void)name;

  self->depth -= 1;

  // Inside a skipped subtree, or closing its root: no frame was pushed
  if (self->skipUntilDepth < self->depth) {
    return;
  }
  if (self->skipUntilDepth == self->depth) {
    self->skipUntilDepth = INT_MAX;
    return;
  }

  if (!self->frames_.empty()) {
    // The closing block still has to receive its last word and line
    if (self->frames_.back().isBlock) {
      self->flushPartWordBuffer();
      self->layoutTextBlock();
    }
    const Frame frame = std::move(self->frames_.back());
    self->frames_.pop_back();
    if (frame.isBlock) {
      self->closeBlock(frame);
      self->startNewTextBlock(0);
    }
  }

  if (self->boldUntilDepth == self->depth) {
    self->boldUntilDepth = INT_MAX;
  }
  if (self->italicUntilDepth == self->depth) {
    self->italicUntilDepth = INT_MAX;
  }
  if (self->preUntilDepth == self->depth) {
    self->preUntilDepth = INT_MAX;
  }
}

void XMLCALL ChapterLayoutParser::defaultHandler(void* userData, const XML_Char* s, int len) {
  // Expat only knows the five XML entities; resolve HTML ones (&nbsp;, &mdash;) here
  if (len >= 3 && s[0] == '&' && s[len - 1] == ';') {
    const char* utf8 = lookupHtmlEntity(s + 1, len - 2);
    if (utf8) {
      characterData(userData, utf8, static_cast<int>(strlen(utf8)));
      return;
    }
  }
  // Not a recognized entity, a comment or a declaration: drop it
}

void ChapterLayoutParser::finish() {
  flushPartWordBuffer();
  layoutTextBlock();

  layout_.pageCount = hasContent_ ? column_ + 1 : 1;
  for (auto& block : layout_.blocks) {
    if (block.pageInChapter >= layout_.pageCount) {
      block.pageInChapter = layout_.pageCount - 1;
    }
  }

  // Without leaf blocks the whole chapter is one block
  if (layout_.blocks.empty()) {
    LayoutBlock block;
    block.textLength = static_cast<uint32_t>(utf8CodepointCount(allText_));
    block.snippet = utf8Prefix(allText_, config.snippetLength);
    layout_.textLength = block.textLength;
    layout_.blocks.push_back(std::move(block));
  }
}

ChapterLayoutParser::~ChapterLayoutParser() { cleanupParser(); }

void ChapterLayoutParser::cleanupParser() {
  if (xmlParser_) {
    XML_SetElementHandler(xmlParser_, nullptr, nullptr);
    XML_SetCharacterDataHandler(xmlParser_, nullptr);
    XML_SetDefaultHandlerExpand(xmlParser_, nullptr);
    XML_ParserFree(xmlParser_);
    xmlParser_ = nullptr;
  }
  currentTextBlock.reset();
}

bool ChapterLayoutParser::parse(const std::string& html) {
  cleanupParser();
  depth = 0;
  skipUntilDepth = INT_MAX;
  boldUntilDepth = INT_MAX;
  italicUntilDepth = INT_MAX;
  preUntilDepth = INT_MAX;
  partWordBufferIndex = 0;
  wordContinues_ = false;
  skipNextNewline_ = false;
  frames_.clear();
  allText_.clear();
  column_ = 0;
  cursorY_ = 0.0f;
  pendingMargin_ = 0.0f;
  hasContent_ = false;
  layout_ = ChapterLayout();
  errorMessage_.clear();

  startNewTextBlock(0);

  xmlParser_ = XML_ParserCreate(nullptr);
  if (!xmlParser_) {
    errorMessage_ = "Couldn't allocate memory for parser";
    LOG_ERR(TAG, "%s", errorMessage_.c_str());
    return false;
  }

  XML_SetUserData(xmlParser_, this);
  XML_SetElementHandler(xmlParser_, startElement, endElement);
  XML_SetCharacterDataHandler(xmlParser_, characterData);
  // Treat undeclared HTML entities as skipped instead of fatal, so the default handler sees them
  XML_UseForeignDTD(xmlParser_, XML_TRUE);
  XML_SetDefaultHandlerExpand(xmlParser_, defaultHandler);

  const auto status = XML_Parse(xmlParser_, html.data(), static_cast<int>(html.size()), XML_TRUE);
  if (status != XML_STATUS_OK) {
    errorMessage_ = std::string("line ") + std::to_string(XML_GetCurrentLineNumber(xmlParser_)) + ": " +
                    XML_ErrorString(XML_GetErrorCode(xmlParser_));
    LOG_ERR(TAG, "Parse error at %s", errorMessage_.c_str());
    cleanupParser();
    return false;
  }

  finish();
  cleanupParser();

  LOG_DBG(TAG, "Laid out %u pages, %d blocks, %u chars", layout_.pageCount, static_cast<int>(layout_.blocks.size()),
          layout_.textLength);
  return true;
}
