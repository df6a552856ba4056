#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../core/Result.h"
#include "../core/Types.h"
#include "LayoutSettings.h"

namespace folio {

struct ChapterMeasurement {
  uint32_t pageCount = 1;
  std::vector<BlockPosition> blocks;
};

/**
 * Lays one chapter out into pages of width x height.
 * Error::ParseFailed means the markup itself is unusable; the engine then
 * estimates that chapter. Any other error aborts the pagination pass.
 */
class ChapterMeasurer {
 public:
  virtual ~ChapterMeasurer() = default;

  virtual Result<ChapterMeasurement> measureChapter(const std::string& html, const std::string& styles,
                                                    const Typography& typography, uint16_t width,
                                                    uint16_t height) = 0;
};

}  // namespace folio
