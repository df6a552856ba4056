#pragma once

#include <CssParser.h>
#include <TextMetrics.h>

#include <memory>
#include <string>

#include "ChapterMeasurer.h"

namespace folio {

/**
 * Headless ChapterMeasurer: normalizes the chapter to XML, walks it with
 * expat and fills fixed-size columns with greedily broken lines.
 */
class LayoutMeasurer : public ChapterMeasurer {
 public:
  // metrics overrides the font-family based estimate (tests, real font backends)
  explicit LayoutMeasurer(uint8_t snippetLength = 20, std::shared_ptr<const TextMetrics> metrics = nullptr);

  Result<ChapterMeasurement> measureChapter(const std::string& html, const std::string& styles,
                                            const Typography& typography, uint16_t width,
                                            uint16_t height) override;

 private:
  const TextMetrics& metricsFor(const Typography& typography);
  const CssParser& stylesheetFor(const std::string& styles);

  uint8_t snippetLength_;
  std::shared_ptr<const TextMetrics> fixedMetrics_;
  std::unique_ptr<EstimatedTextMetrics> estimatedMetrics_;

  // The book stylesheet rarely changes between chapters
  std::string cssSource_;
  CssParser css_;
  bool cssParsed_ = false;
};

}  // namespace folio
