#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace folio {

// One chapter in reading order. charOffset is the plain-text length of all preceding chapters.
struct ChapterMeta {
  uint32_t chapterIndex = 0;
  std::string href;
  uint32_t charOffset = 0;
  uint32_t charLength = 0;
};

struct BookMeta {
  std::vector<ChapterMeta> chapters;
  std::string styles;  // book-wide CSS
  uint32_t totalCharacters = 0;
};

struct ChapterContent {
  uint32_t chapterIndex = 0;
  std::string href;
  std::string html;
  uint32_t charOffset = 0;
  uint32_t charLength = 0;
};

// Chapter as seen by pagination: meta always, content only while loaded
struct PaginationChapter {
  uint32_t chapterIndex = 0;
  std::string href;
  uint32_t charLength = 0;
  std::shared_ptr<const ChapterContent> content;

  bool loaded() const { return content != nullptr; }

  const std::string& html() const {
    static const std::string empty;
    return content ? content->html : empty;
  }
};

// Immutable; a new pointer is published whenever the loaded set changes
using PaginationSnapshot = std::shared_ptr<const std::vector<PaginationChapter>>;

struct ChapterPageRange {
  uint32_t chapterIndex = 0;
  uint32_t startPage = 0;
  uint32_t pageCount = 1;
  bool measured = false;
};

struct BlockPosition {
  uint32_t blockIndex = 0;
  uint32_t pageInChapter = 0;
  uint32_t textOffset = 0;  // text length of the preceding blocks of the chapter
  uint32_t textLength = 0;
  std::string snippet;
};

struct ChapterBlockMap {
  uint32_t chapterIndex = 0;
  std::vector<BlockPosition> blocks;

  uint32_t totalChars() const {
    uint32_t total = 0;
    for (const auto& b : blocks) total += b.textLength;
    return total;
  }
};

using BlockMaps = std::map<uint32_t, ChapterBlockMap>;

// Layout-independent reading position
struct ReadingAnchor {
  uint32_t chapterIndex = 0;
  uint32_t blockIndex = 0;
  uint32_t charOffset = 0;  // offset inside the chapter's block text
  std::string textSnippet;

  bool operator==(const ReadingAnchor& o) const {
    return chapterIndex == o.chapterIndex && blockIndex == o.blockIndex && charOffset == o.charOffset &&
           textSnippet == o.textSnippet;
  }
  bool operator!=(const ReadingAnchor& o) const { return !(*this == o); }
};

// Everything a saved location string can carry
struct StoredPosition {
  bool hasAnchor = false;
  ReadingAnchor anchor;
  uint32_t charOffset = 0;        // "char:N", global plain-text offset
  int32_t pageNumber = -1;        // "page:N", -1 when absent
  uint32_t legacyPageTotal = 0;   // "page:N/T", 0 when absent
  std::string settingsFingerprint;  // "fp:..."
};

}  // namespace folio
