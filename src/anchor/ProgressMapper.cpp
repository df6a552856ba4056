#include "ProgressMapper.h"

#include <Logging.h>

#include <algorithm>
#include <cmath>

#define TAG "PROGRESS"

namespace folio {

PageWindow calcPageWindow(const uint32_t center, const uint32_t totalPages, const uint32_t windowSize) {
  PageWindow window;
  if (totalPages <= windowSize) {
    window.end = totalPages;
    return window;
  }
  const uint32_t half = windowSize / 2;
  window.start = center > half ? center - half : 0;
  window.end = window.start + windowSize;
  if (window.end > totalPages) {
    window.end = totalPages;
    window.start = window.end - windowSize;
  }
  return window;
}

ProgressMapper::ProgressMapper(const std::vector<ChapterMeta>& chapters, std::vector<ChapterPageRange> ranges,
                               const uint32_t totalPages)
    : ranges_(std::move(ranges)), totalPages_(totalPages) {
  lengths_.reserve(chapters.size());
  cumulativeOffsets_.reserve(chapters.size() + 1);
  cumulativeOffsets_.push_back(0);
  uint32_t total = 0;
  for (const auto& chapter : chapters) {
    lengths_.push_back(chapter.charLength);
    total += chapter.charLength;
    cumulativeOffsets_.push_back(total);
  }
}

uint8_t ProgressMapper::percentage(const uint32_t page, const uint32_t totalPages) {
  if (totalPages == 0) return 0;
  const double last = std::max(1.0, static_cast<double>(totalPages) - 1.0);
  const long pct = std::lround(page / last * 100.0);
  return static_cast<uint8_t>(std::min(100L, std::max(0L, pct)));
}

uint32_t ProgressMapper::pageToCharOffset(const uint32_t page) const {
  if (totalTextLength() == 0 || totalPages_ == 0) return 0;
  const ChapterPageRange* range = findRangeForPage(page, ranges_);
  if (!range || range->chapterIndex >= lengths_.size()) return 0;

  const uint32_t index = range->chapterIndex;
  const double ratio = static_cast<double>(page - range->startPage) / std::max<uint32_t>(1, range->pageCount);
  return static_cast<uint32_t>(std::llround(cumulativeOffsets_[index] + ratio * lengths_[index]));
}

uint32_t ProgressMapper::charOffsetToPage(const uint32_t offset) const {
  if (totalTextLength() == 0 || totalPages_ == 0 || offset == 0) return 0;

  // Chapter holding the offset; offsets past the end land in the last chapter
  const auto it = std::upper_bound(cumulativeOffsets_.begin() + 1, cumulativeOffsets_.end(), offset);
  size_t index = static_cast<size_t>(std::distance(cumulativeOffsets_.begin(), it)) - 1;
  if (index >= lengths_.size()) index = lengths_.size() - 1;
  if (index >= ranges_.size()) return 0;

  const uint32_t local = offset - std::min(offset, cumulativeOffsets_[index]);
  const double length = lengths_[index] > 0 ? lengths_[index] : 1.0;
  const double ratio = std::min(local / length, 1.0);
  const ChapterPageRange& range = ranges_[index];
  const uint32_t lastInChapter = range.pageCount > 0 ? range.pageCount - 1 : 0;
  const auto pageInChapter =
      std::min(static_cast<uint32_t>(std::llround(ratio * range.pageCount)), lastInChapter);
  return std::min(range.startPage + pageInChapter, totalPages_ - 1);
}

uint32_t ProgressMapper::legacyPageToCharOffset(const StoredPosition& position) const {
  if (position.pageNumber <= 0) return 0;
  const auto page = static_cast<double>(position.pageNumber);
  const double total = totalTextLength();

  if (position.legacyPageTotal > 0) {
    const double last = std::max(1.0, static_cast<double>(position.legacyPageTotal) - 1.0);
    return static_cast<uint32_t>(std::llround(std::min(page / last, 1.0) * total));
  }
  if (totalPages_ > 0) {
    const double last = std::max(1.0, static_cast<double>(totalPages_) - 1.0);
    return static_cast<uint32_t>(std::llround(std::min(page / last, 1.0) * total));
  }
  return 0;
}

uint32_t ProgressMapper::restorePage(const StoredPosition& position, const BlockMaps& blockMaps,
                                     const std::string& fingerprint, const size_t fuzzyPrefix) const {
  if (totalPages_ == 0) return 0;

  if (position.hasAnchor) {
    return anchorToPage(position.anchor, ranges_, blockMaps, fuzzyPrefix);
  }
  if (position.charOffset > 0) {
    return charOffsetToPage(position.charOffset);
  }
  if (position.pageNumber >= 0 && !position.settingsFingerprint.empty() &&
      position.settingsFingerprint == fingerprint) {
    // Same layout: the page number is still exact
    return std::min(static_cast<uint32_t>(position.pageNumber), totalPages_ - 1);
  }
  if (position.pageNumber > 0) {
    LOG_DBG(TAG, "Converting legacy page %d proportionally", position.pageNumber);
    return charOffsetToPage(legacyPageToCharOffset(position));
  }
  return 0;
}

}  // namespace folio
