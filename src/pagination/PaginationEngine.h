#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../core/Types.h"
#include "ChapterMeasurer.h"
#include "LayoutSettings.h"

namespace folio {

class MeasurementCache;

struct PaginationResult {
  uint32_t totalPages = 0;
  std::vector<ChapterPageRange> chapterPageRanges;
  BlockMaps blockMaps;
  uint16_t pageWidth = 0;
  uint16_t pageHeight = 0;
  bool isReady = false;
  double avgCharsPerPage = 0.0;
  std::string fingerprint;
};

/**
 * Global page index for a book: loaded chapters are measured, the rest are
 * estimated from their character count using the measured chapters' density.
 */
class PaginationEngine {
 public:
  // cache may be null
  explicit PaginationEngine(ChapterMeasurer& measurer, MeasurementCache* cache = nullptr)
      : measurer_(measurer), cache_(cache) {}

  PaginationResult paginate(const std::vector<PaginationChapter>& chapters, const std::string& styles,
                            const LayoutSettings& settings);

  // Characters per page derived from typography alone, at least 100
  static uint32_t analyticCharsPerPage(const LayoutSettings& settings);

  static uint32_t estimatePageCount(uint32_t charLength, double avgCharsPerPage);

 private:
  enum class MeasureOutcome : uint8_t { Measured, Unusable, Fatal };

  MeasureOutcome measure(const PaginationChapter& chapter, const std::string& styles, const LayoutSettings& settings,
                         ChapterMeasurement& out);

  ChapterMeasurer& measurer_;
  MeasurementCache* cache_;
};

}  // namespace folio
