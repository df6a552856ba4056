#include "PaginationEngine.h"

#include <Logging.h>

#include <cmath>
#include <exception>

#include "MeasurementCache.h"

#define TAG "PAGIN"

namespace folio {

uint32_t PaginationEngine::analyticCharsPerPage(const LayoutSettings& settings) {
  const double fontSize = settings.typography.fontSize > 0.0f ? settings.typography.fontSize : 16.0;
  const double lineHeight = settings.typography.lineHeight > 0.0f ? settings.typography.lineHeight : 1.8;
  const double charsPerLine = std::floor(settings.contentWidth() / (fontSize * 0.7));
  const double linesPerPage = std::floor(settings.contentHeight() / (fontSize * lineHeight));
  const double product = charsPerLine * linesPerPage;
  return product < 100.0 ? 100 : static_cast<uint32_t>(product);
}

uint32_t PaginationEngine::estimatePageCount(const uint32_t charLength, const double avgCharsPerPage) {
  if (avgCharsPerPage <= 0.0) return 1;
  const auto pages = static_cast<long long>(std::llround(charLength / avgCharsPerPage));
  return pages < 1 ? 1 : static_cast<uint32_t>(pages);
}

PaginationEngine::MeasureOutcome PaginationEngine::measure(const PaginationChapter& chapter, const std::string& styles,
                                                           const LayoutSettings& settings, ChapterMeasurement& out) {
  uint64_t hash = 0;
  if (cache_) {
    hash = MeasurementCache::hashContent(chapter.html(), styles);
    if (const ChapterMeasurement* cached = cache_->find(chapter.chapterIndex, hash)) {
      out = *cached;
      if (out.pageCount < 1) out.pageCount = 1;
      return MeasureOutcome::Measured;
    }
  }

  Result<ChapterMeasurement> result;
  try {
    result = measurer_.measureChapter(chapter.html(), styles, settings.typography, settings.contentWidth(),
                                      settings.contentHeight());
  } catch (const std::exception& e) {
    LOG_ERR(TAG, "Measuring chapter %u threw: %s", chapter.chapterIndex, e.what());
    return MeasureOutcome::Fatal;
  }

  if (!result.ok()) {
    if (result.err == Error::ParseFailed) {
      LOG_ERR(TAG, "Chapter %u markup unusable, estimating it", chapter.chapterIndex);
      return MeasureOutcome::Unusable;
    }
    LOG_ERR(TAG, "Measuring chapter %u failed: %s", chapter.chapterIndex, errorToString(result.err));
    return MeasureOutcome::Fatal;
  }

  out = std::move(result.value);
  if (out.pageCount < 1) out.pageCount = 1;
  if (cache_) {
    cache_->put(chapter.chapterIndex, hash, out);
  }
  return MeasureOutcome::Measured;
}

PaginationResult PaginationEngine::paginate(const std::vector<PaginationChapter>& chapters, const std::string& styles,
                                            const LayoutSettings& settings) {
  PaginationResult result;
  result.pageWidth = settings.contentWidth();
  result.pageHeight = settings.contentHeight();
  result.fingerprint = settings.fingerprint();
  result.isReady = true;

  if (cache_) {
    cache_->bind(result.fingerprint);
  }

  if (chapters.empty()) {
    return result;
  }

  const unsigned long start = millis();

  // 1. Exact page counts and block maps for loaded chapters
  std::vector<uint32_t> measuredPages(chapters.size(), 0);
  uint64_t measuredChars = 0;
  uint64_t totalMeasuredPages = 0;
  for (size_t i = 0; i < chapters.size(); i++) {
    const PaginationChapter& chapter = chapters[i];
    if (!chapter.loaded()) continue;

    ChapterMeasurement measurement;
    const MeasureOutcome outcome = measure(chapter, styles, settings, measurement);
    if (outcome == MeasureOutcome::Fatal) {
      // Ready but empty rather than a pass that never completes
      PaginationResult empty;
      empty.pageWidth = result.pageWidth;
      empty.pageHeight = result.pageHeight;
      empty.fingerprint = result.fingerprint;
      empty.isReady = true;
      return empty;
    }
    if (outcome == MeasureOutcome::Unusable) continue;

    measuredPages[i] = measurement.pageCount;
    measuredChars += chapter.charLength;
    totalMeasuredPages += measurement.pageCount;

    ChapterBlockMap map;
    map.chapterIndex = chapter.chapterIndex;
    map.blocks = std::move(measurement.blocks);
    result.blockMaps[chapter.chapterIndex] = std::move(map);
  }

  // 2. Density from measured chapters, or from typography when there are none
  double avgCharsPerPage = 0.0;
  if (totalMeasuredPages > 0) {
    avgCharsPerPage = static_cast<double>(measuredChars) / static_cast<double>(totalMeasuredPages);
  }
  if (avgCharsPerPage <= 0.0) {
    avgCharsPerPage = analyticCharsPerPage(settings);
  }
  result.avgCharsPerPage = avgCharsPerPage;

  // 3. Ranges in chapter order
  uint32_t cumulativePages = 0;
  result.chapterPageRanges.reserve(chapters.size());
  for (size_t i = 0; i < chapters.size(); i++) {
    ChapterPageRange range;
    range.chapterIndex = chapters[i].chapterIndex;
    range.startPage = cumulativePages;
    range.measured = measuredPages[i] > 0;
    range.pageCount = range.measured ? measuredPages[i] : estimatePageCount(chapters[i].charLength, avgCharsPerPage);
    cumulativePages += range.pageCount;
    result.chapterPageRanges.push_back(range);
  }
  result.totalPages = cumulativePages;

  LOG_INF(TAG, "%u pages, %d chapters (%d measured), %ux%u in %lu ms", result.totalPages,
          static_cast<int>(chapters.size()), static_cast<int>(result.blockMaps.size()),
          static_cast<unsigned>(result.pageWidth), static_cast<unsigned>(result.pageHeight), millis() - start);
  return result;
}

}  // namespace folio
