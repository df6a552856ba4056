#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../core/Result.h"
#include "../core/Types.h"

namespace folio {

constexpr size_t DEFAULT_FUZZY_PREFIX = 10;

/**
 * "anchor:3:12:0|snippet:Once upon a time|char:25000"
 * Pipes inside the snippet become spaces. char: is written only for a positive offset.
 */
std::string serializeAnchor(const ReadingAnchor& anchor, uint32_t globalCharOffset = 0);

/**
 * Parse a saved location in the current or a legacy format ("char:N|page:N|fp:...").
 * Never fails: unknown segments are ignored and missing ones keep their defaults.
 */
StoredPosition deserializeAnchor(const std::string& location);

// Range owning the global page, or nullptr
const ChapterPageRange* findRangeForPage(uint32_t page, const std::vector<ChapterPageRange>& ranges);
const ChapterPageRange* findRangeForChapter(uint32_t chapterIndex, const std::vector<ChapterPageRange>& ranges);

/**
 * Anchor of the first block visible on a global page.
 * Error::OutOfRange when no chapter owns the page.
 */
Result<ReadingAnchor> pageToAnchor(uint32_t page, const std::vector<ChapterPageRange>& ranges,
                                   const BlockMaps& blockMaps);

/**
 * Page showing the anchored block. Falls back from block index to snippet,
 * fuzzy snippet and proportional offset, and finally the chapter's first page.
 * Never leaves the anchor's chapter while that chapter has a range.
 */
uint32_t anchorToPage(const ReadingAnchor& anchor, const std::vector<ChapterPageRange>& ranges,
                      const BlockMaps& blockMaps, size_t fuzzyPrefix = DEFAULT_FUZZY_PREFIX);

}  // namespace folio
