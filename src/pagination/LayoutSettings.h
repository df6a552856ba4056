#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace folio {

struct Typography {
  float fontSize = 16.0f;
  float lineHeight = 1.8f;
  std::string fontFamily = "system";

  bool operator==(const Typography& o) const {
    return std::abs(fontSize - o.fontSize) < 1e-6f && std::abs(lineHeight - o.lineHeight) < 1e-6f &&
           fontFamily == o.fontFamily;
  }
  bool operator!=(const Typography& o) const { return !(*this == o); }
};

/**
 * Everything that decides where page boundaries fall, apart from the content itself.
 * Content dimensions are the page minus its padding.
 */
struct LayoutSettings {
  static constexpr uint16_t MIN_DIMENSION = 200;

  Typography typography;
  uint16_t pageWidth = 376;
  uint16_t pageHeight = 527;

  uint16_t contentWidth() const { return pageWidth < MIN_DIMENSION ? MIN_DIMENSION : pageWidth; }
  uint16_t contentHeight() const { return pageHeight < MIN_DIMENSION ? MIN_DIMENSION : pageHeight; }

  // "16_1.8_system_376_527"; a page number saved under one fingerprint is only valid under the same one
  std::string fingerprint() const;

  bool operator==(const LayoutSettings& o) const {
    return typography == o.typography && contentWidth() == o.contentWidth() && contentHeight() == o.contentHeight();
  }
  bool operator!=(const LayoutSettings& o) const { return !(*this == o); }
};

}  // namespace folio
