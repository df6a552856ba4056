#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../core/Types.h"
#include "AnchorCodec.h"

namespace folio {

struct PageWindow {
  uint32_t start = 0;
  uint32_t end = 0;  // exclusive
};

// At most windowSize pages centred on center, shifted to stay inside the book
PageWindow calcPageWindow(uint32_t center, uint32_t totalPages, uint32_t windowSize);

/**
 * Converts between global pages, whole-book character offsets and reading
 * percentages for one pagination generation.
 */
class ProgressMapper {
 public:
  ProgressMapper(const std::vector<ChapterMeta>& chapters, std::vector<ChapterPageRange> ranges, uint32_t totalPages);

  uint32_t totalTextLength() const { return cumulativeOffsets_.back(); }
  uint32_t totalPages() const { return totalPages_; }

  static uint8_t percentage(uint32_t page, uint32_t totalPages);

  uint32_t pageToCharOffset(uint32_t page) const;
  uint32_t charOffsetToPage(uint32_t offset) const;

  // "page:p/t" or "page:p" from the oldest saved positions
  uint32_t legacyPageToCharOffset(const StoredPosition& position) const;

  /**
   * Page for a saved position: the anchor if present, else the char: offset,
   * else a page: number saved under the same fingerprint, else a proportional page:.
   */
  uint32_t restorePage(const StoredPosition& position, const BlockMaps& blockMaps, const std::string& fingerprint,
                       size_t fuzzyPrefix = DEFAULT_FUZZY_PREFIX) const;

 private:
  std::vector<uint32_t> lengths_;
  std::vector<uint32_t> cumulativeOffsets_;  // one more entry than lengths_
  std::vector<ChapterPageRange> ranges_;
  uint32_t totalPages_;
};

}  // namespace folio
