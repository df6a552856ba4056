#include "AnchorCodec.h"

#include <Logging.h>
#include <Utf8.h>

#include <algorithm>
#include <cctype>
#include <cstring>

#define TAG "ANCHOR"

namespace folio {

namespace {

constexpr const char* ANCHOR_PREFIX = "anchor:";
constexpr const char* SNIPPET_PREFIX = "snippet:";
constexpr const char* CHAR_PREFIX = "char:";
constexpr const char* PAGE_PREFIX = "page:";
constexpr const char* FINGERPRINT_PREFIX = "fp:";

bool startsWith(const std::string& s, const char* prefix) { return s.compare(0, strlen(prefix), prefix) == 0; }

// Leading sign and digits; trailing garbage is ignored. Returns false when no digit is found.
bool parseLeadingInt(const std::string& s, size_t pos, long long& out, size_t* endPos = nullptr) {
  while (pos < s.size() && isspace(static_cast<unsigned char>(s[pos]))) pos++;
  bool negative = false;
  if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
    negative = s[pos] == '-';
    pos++;
  }
  const size_t digitsStart = pos;
  long long value = 0;
  while (pos < s.size() && isdigit(static_cast<unsigned char>(s[pos]))) {
    if (value < 1000000000000LL) {
      value = value * 10 + (s[pos] - '0');
    }
    pos++;
  }
  if (pos == digitsStart) return false;
  out = negative ? -value : value;
  if (endPos) *endPos = pos;
  return true;
}

bool parseUnsigned32(const std::string& s, const size_t pos, uint32_t& out) {
  long long value = 0;
  if (!parseLeadingInt(s, pos, value) || value < 0 || value > 0xFFFFFFFFLL) return false;
  out = static_cast<uint32_t>(value);
  return true;
}

bool parseAnchorFields(const std::string& part, ReadingAnchor& anchor) {
  // anchor:chapterIndex:blockIndex:charOffset
  std::vector<std::string> fields;
  size_t start = strlen(ANCHOR_PREFIX);
  while (true) {
    const size_t colon = part.find(':', start);
    fields.push_back(part.substr(start, colon == std::string::npos ? std::string::npos : colon - start));
    if (colon == std::string::npos) break;
    start = colon + 1;
  }
  if (fields.size() < 3) return false;

  long long values[3] = {};
  for (int i = 0; i < 3; i++) {
    if (!parseLeadingInt(fields[i], 0, values[i])) return false;
  }
  if (values[0] < 0 || values[1] < 0 || values[2] < 0 || values[0] > 0xFFFFFFFFLL || values[1] > 0xFFFFFFFFLL ||
      values[2] > 0xFFFFFFFFLL) {
    return false;
  }
  anchor.chapterIndex = static_cast<uint32_t>(values[0]);
  anchor.blockIndex = static_cast<uint32_t>(values[1]);
  anchor.charOffset = static_cast<uint32_t>(values[2]);
  anchor.textSnippet.clear();
  return true;
}

bool fuzzyMatch(const std::string& blockSnippet, const std::string& anchorSnippet, const size_t prefix) {
  const std::string anchorPrefix = utf8Prefix(anchorSnippet, prefix);
  const std::string blockPrefix = utf8Prefix(blockSnippet, prefix);
  // An empty search text would match everything
  if (!anchorPrefix.empty() && blockSnippet.find(anchorPrefix) != std::string::npos) return true;
  if (!blockPrefix.empty() && anchorSnippet.find(blockPrefix) != std::string::npos) return true;
  return false;
}

}  // namespace

std::string serializeAnchor(const ReadingAnchor& anchor, const uint32_t globalCharOffset) {
  std::string out = ANCHOR_PREFIX;
  out += std::to_string(anchor.chapterIndex);
  out += ':';
  out += std::to_string(anchor.blockIndex);
  out += ':';
  out += std::to_string(anchor.charOffset);

  if (!anchor.textSnippet.empty()) {
    std::string snippet = anchor.textSnippet;
    std::replace(snippet.begin(), snippet.end(), '|', ' ');
    out += '|';
    out += SNIPPET_PREFIX;
    out += snippet;
  }
  if (globalCharOffset > 0) {
    out += '|';
    out += CHAR_PREFIX;
    out += std::to_string(globalCharOffset);
  }
  return out;
}

StoredPosition deserializeAnchor(const std::string& location) {
  StoredPosition position;
  if (location.empty()) return position;

  std::string snippet;
  size_t start = 0;
  while (start <= location.size()) {
    size_t end = location.find('|', start);
    if (end == std::string::npos) end = location.size();
    const std::string part = location.substr(start, end - start);

    if (startsWith(part, ANCHOR_PREFIX)) {
      ReadingAnchor anchor;
      if (parseAnchorFields(part, anchor)) {
        position.anchor = anchor;
        position.hasAnchor = true;
      } else {
        LOG_DBG(TAG, "Ignoring malformed segment %s", part.c_str());
      }
    } else if (startsWith(part, SNIPPET_PREFIX)) {
      snippet = part.substr(strlen(SNIPPET_PREFIX));
    } else if (startsWith(part, CHAR_PREFIX)) {
      uint32_t value = 0;
      if (parseUnsigned32(part, strlen(CHAR_PREFIX), value)) position.charOffset = value;
    } else if (startsWith(part, PAGE_PREFIX)) {
      long long value = 0;
      size_t after = 0;
      if (parseLeadingInt(part, strlen(PAGE_PREFIX), value, &after) && value >= 0 && value <= 0x7FFFFFFFLL) {
        position.pageNumber = static_cast<int32_t>(value);
        // Oldest format: "page:p/t"
        uint32_t total = 0;
        if (after < part.size() && part[after] == '/' && parseUnsigned32(part, after + 1, total)) {
          position.legacyPageTotal = total;
        }
      }
    } else if (startsWith(part, FINGERPRINT_PREFIX)) {
      position.settingsFingerprint = part.substr(strlen(FINGERPRINT_PREFIX));
    }

    start = end + 1;
  }
  // Segments may come in any order; the snippet only has meaning with an anchor
  if (position.hasAnchor) position.anchor.textSnippet = snippet;
  return position;
}

const ChapterPageRange* findRangeForPage(const uint32_t page, const std::vector<ChapterPageRange>& ranges) {
  size_t lo = 0;
  size_t hi = ranges.size();
  while (lo < hi) {
    const size_t mid = lo + (hi - lo) / 2;
    const ChapterPageRange& r = ranges[mid];
    if (page < r.startPage) {
      hi = mid;
    } else if (page >= r.startPage + r.pageCount) {
      lo = mid + 1;
    } else {
      return &r;
    }
  }
  return nullptr;
}

const ChapterPageRange* findRangeForChapter(const uint32_t chapterIndex, const std::vector<ChapterPageRange>& ranges) {
  const auto it = std::lower_bound(
      ranges.begin(), ranges.end(), chapterIndex,
      [](const ChapterPageRange& r, const uint32_t index) { return r.chapterIndex < index; });
  if (it == ranges.end() || it->chapterIndex != chapterIndex) return nullptr;
  return &*it;
}

Result<ReadingAnchor> pageToAnchor(const uint32_t page, const std::vector<ChapterPageRange>& ranges,
                                   const BlockMaps& blockMaps) {
  const ChapterPageRange* range = findRangeForPage(page, ranges);
  if (!range) {
    return Err<ReadingAnchor>(Error::OutOfRange);
  }

  ReadingAnchor anchor;
  anchor.chapterIndex = range->chapterIndex;
  const uint32_t pageInChapter = page - range->startPage;

  const auto mapIt = blockMaps.find(range->chapterIndex);
  if (mapIt == blockMaps.end() || mapIt->second.blocks.empty()) {
    // Not measured yet: chapter-level anchor
    return Ok(anchor);
  }
  const std::vector<BlockPosition>& blocks = mapIt->second.blocks;

  const BlockPosition* target = nullptr;
  for (const auto& block : blocks) {
    if (block.pageInChapter == pageInChapter) {
      target = &block;
      break;
    }
  }
  // A page that starts inside a block belongs to the closest preceding one
  if (!target) {
    for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
      if (it->pageInChapter <= pageInChapter) {
        target = &*it;
        break;
      }
    }
  }
  if (!target) target = &blocks.front();

  anchor.blockIndex = target->blockIndex;
  anchor.textSnippet = target->snippet;
  return Ok(anchor);
}

uint32_t anchorToPage(const ReadingAnchor& anchor, const std::vector<ChapterPageRange>& ranges,
                      const BlockMaps& blockMaps, const size_t fuzzyPrefix) {
  const ChapterPageRange* range = findRangeForChapter(anchor.chapterIndex, ranges);
  if (!range) return 0;

  const auto mapIt = blockMaps.find(anchor.chapterIndex);
  if (mapIt == blockMaps.end() || mapIt->second.blocks.empty()) return range->startPage;
  const std::vector<BlockPosition>& blocks = mapIt->second.blocks;

  const BlockPosition* block = nullptr;

  // 1. Same block
  for (const auto& b : blocks) {
    if (b.blockIndex == anchor.blockIndex) {
      block = &b;
      break;
    }
  }

  if (!block && !anchor.textSnippet.empty()) {
    // 2. Same snippet
    for (const auto& b : blocks) {
      if (b.snippet == anchor.textSnippet) {
        block = &b;
        break;
      }
    }
    // 3. Snippets sharing a prefix
    if (!block) {
      for (const auto& b : blocks) {
        if (fuzzyMatch(b.snippet, anchor.textSnippet, fuzzyPrefix)) {
          block = &b;
          break;
        }
      }
    }
  }

  // 4. Proportional position in the chapter text
  if (!block && anchor.charOffset > 0 && mapIt->second.totalChars() > 0) {
    for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
      if (it->textOffset <= anchor.charOffset) {
        block = &*it;
        break;
      }
    }
  }

  if (!block) {
    LOG_DBG(TAG, "No block for anchor %u:%u, using chapter start", anchor.chapterIndex, anchor.blockIndex);
    return range->startPage;
  }

  // Never outside the chapter, even if the map is from another layout
  const uint32_t pageInChapter = std::min(block->pageInChapter, range->pageCount > 0 ? range->pageCount - 1 : 0);
  return range->startPage + pageInChapter;
}

}  // namespace folio
