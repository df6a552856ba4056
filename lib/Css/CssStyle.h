#pragma once

#include <cstdint>

/**
 * Length units understood by the measurer
 */
enum class CssUnit : uint8_t {
  Px,
  Em,       // relative to the element's (or parent's, for font-size) font size
  Rem,      // relative to the root font size
  Percent,  // relative to the containing block (or parent font size, for font-size)
};

struct CssLength {
  float value = 0.0f;
  CssUnit unit = CssUnit::Px;

  CssLength() = default;
  CssLength(float value, CssUnit unit) : value(value), unit(unit) {}

  float toPx(float emBase, float remBase, float percentBase) const {
    switch (unit) {
      case CssUnit::Em:
        return value * emBase;
      case CssUnit::Rem:
        return value * remBase;
      case CssUnit::Percent:
        return value * percentBase / 100.0f;
      case CssUnit::Px:
      default:
        return value;
    }
  }
};

/**
 * Font style values (italic)
 */
enum class CssFontStyle {
  Normal,  // Default normal style
  Italic   // Italic text
};

/**
 * Font weight values (bold)
 */
enum class CssFontWeight {
  Normal,  // Default normal weight
  Bold     // Bold text (600+)
};

/**
 * Box generation for an element
 */
enum class CssDisplay {
  Block,
  Inline,
  None  // element and its subtree take no space
};

/**
 * CssStyle - Represents supported CSS properties for a selector
 *
 * Supported properties:
 * - font-style: normal, italic
 * - font-weight: normal, bold (600+)
 * - font-size: px, pt, em, rem, %, keywords
 * - text-indent: px, pt, em, rem, %
 * - margin-top/bottom and the margin shorthand: px, pt, em, rem, %
 * - display: none, block, inline
 */
struct CssStyle {
  CssFontStyle fontStyle = CssFontStyle::Normal;
  bool hasFontStyle = false;

  CssFontWeight fontWeight = CssFontWeight::Normal;
  bool hasFontWeight = false;

  CssLength fontSize;
  bool hasFontSize = false;

  CssLength textIndent;
  bool hasTextIndent = false;

  CssLength marginTop;
  bool hasMarginTop = false;

  CssLength marginBottom;
  bool hasMarginBottom = false;

  CssDisplay display = CssDisplay::Block;
  bool hasDisplay = false;

  bool hasAny() const {
    return hasFontStyle || hasFontWeight || hasFontSize || hasTextIndent || hasMarginTop || hasMarginBottom ||
           hasDisplay;
  }

  // Merge another style into this one (other style takes precedence)
  void merge(const CssStyle& other) {
    if (other.hasFontStyle) {
      fontStyle = other.fontStyle;
      hasFontStyle = true;
    }
    if (other.hasFontWeight) {
      fontWeight = other.fontWeight;
      hasFontWeight = true;
    }
    if (other.hasFontSize) {
      fontSize = other.fontSize;
      hasFontSize = true;
    }
    if (other.hasTextIndent) {
      textIndent = other.textIndent;
      hasTextIndent = true;
    }
    if (other.hasMarginTop) {
      marginTop = other.marginTop;
      hasMarginTop = true;
    }
    if (other.hasMarginBottom) {
      marginBottom = other.marginBottom;
      hasMarginBottom = true;
    }
    if (other.hasDisplay) {
      display = other.display;
      hasDisplay = true;
    }
  }
};
