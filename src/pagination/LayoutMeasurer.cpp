#include "LayoutMeasurer.h"

#include <ChapterLayoutParser.h>
#include <Html5Normalizer.h>
#include <Logging.h>

#define TAG "MEASURE"

namespace folio {

namespace {
constexpr const char* CHAPTER_ROOT_TAG = "folio-chapter";
}

LayoutMeasurer::LayoutMeasurer(const uint8_t snippetLength, std::shared_ptr<const TextMetrics> metrics)
    : snippetLength_(snippetLength), fixedMetrics_(std::move(metrics)) {}

const TextMetrics& LayoutMeasurer::metricsFor(const Typography& typography) {
  if (fixedMetrics_) return *fixedMetrics_;

  const FontClass fontClass = EstimatedTextMetrics::classify(typography.fontFamily);
  if (!estimatedMetrics_ || estimatedMetrics_->fontClass() != fontClass) {
    estimatedMetrics_.reset(new EstimatedTextMetrics(fontClass));
  }
  return *estimatedMetrics_;
}

const CssParser& LayoutMeasurer::stylesheetFor(const std::string& styles) {
  if (!cssParsed_ || styles != cssSource_) {
    css_.clear();
    css_.parseString(styles);
    cssSource_ = styles;
    cssParsed_ = true;
  }
  return css_;
}

Result<ChapterMeasurement> LayoutMeasurer::measureChapter(const std::string& html, const std::string& styles,
                                                          const Typography& typography, const uint16_t width,
                                                          const uint16_t height) {
  if (width == 0 || height == 0) {
    return Err<ChapterMeasurement>(Error::InvalidState);
  }

  LayoutConfig config(typography.fontSize, typography.lineHeight, width, height);
  config.snippetLength = snippetLength_;

  const CssParser& css = stylesheetFor(styles);
  ChapterLayoutParser parser(metricsFor(typography), config, css.hasStyles() ? &css : nullptr);
  if (!parser.parse(html5::toXmlFragment(html, CHAPTER_ROOT_TAG))) {
    LOG_ERR(TAG, "Unusable chapter markup (%s)", parser.errorMessage().c_str());
    return Err<ChapterMeasurement>(Error::ParseFailed);
  }

  const ChapterLayout& layout = parser.getLayout();
  ChapterMeasurement measurement;
  measurement.pageCount = layout.pageCount > 0 ? layout.pageCount : 1;
  measurement.blocks.reserve(layout.blocks.size());
  for (size_t i = 0; i < layout.blocks.size(); i++) {
    const LayoutBlock& block = layout.blocks[i];
    BlockPosition position;
    position.blockIndex = static_cast<uint32_t>(i);
    position.pageInChapter = block.pageInChapter;
    position.textOffset = block.textOffset;
    position.textLength = block.textLength;
    position.snippet = block.snippet;
    measurement.blocks.push_back(std::move(position));
  }
  return Ok(std::move(measurement));
}

}  // namespace folio
