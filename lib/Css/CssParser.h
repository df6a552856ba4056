#pragma once

#include <map>
#include <string>

#include "CssStyle.h"

/**
 * CssParser - Simple CSS parser for extracting the properties that affect page breaks
 *
 * Handles:
 * - Class selectors (.classname)
 * - Element.class selectors (p.classname)
 * - Tag selectors (p, div, etc.)
 * - Multiple selectors separated by commas
 * - Inline styles
 *
 * Limitations:
 * - Does not support complex selectors (descendant, child, etc.)
 * - Does not support pseudo-classes or pseudo-elements
 * - Only extracts properties we actually use
 */
class CssParser {
 public:
  CssParser() = default;

  /**
   * Parse a stylesheet and add its rules to the style map
   */
  void parseString(const std::string& css);

  /**
   * Parse a CSS file and add its rules to the style map
   * Returns false if the file cannot be read
   */
  bool parseFile(const char* filepath);

  /**
   * Get the style for a given selector (class or tag)
   * Returns nullptr if no style is defined
   */
  const CssStyle* getStyleForClass(const std::string& className) const;

  /**
   * Get the combined style for a tag with multiple class names (space-separated)
   * Styles are merged in order, later classes override earlier ones
   */
  CssStyle getCombinedStyle(const std::string& tagName, const std::string& classNames) const;

  /**
   * Parse an inline style attribute (e.g., "font-weight: bold; margin: 0")
   */
  static CssStyle parseInlineStyle(const std::string& styleAttr);

  /**
   * Parse a CSS length ("1.5em", "12px", "50%", "0"). Returns false for anything else.
   */
  static bool parseLength(const std::string& value, CssLength& out);

  bool hasStyles() const { return !styleMap_.empty(); }
  size_t getStyleCount() const { return styleMap_.size(); }
  void clear() { styleMap_.clear(); }

 private:
  void parseRule(const std::string& selector, const std::string& properties);
  static void parseDeclarations(const std::string& properties, CssStyle& style);
  static void parseProperty(const std::string& name, const std::string& value, CssStyle& style);
  static CssFontStyle parseFontStyle(const std::string& value);
  static CssFontWeight parseFontWeight(const std::string& value);
  static bool parseFontSize(const std::string& value, CssLength& out);
  static void parseMarginShorthand(const std::string& value, CssStyle& style);

  static constexpr size_t MAX_CSS_RULES = 4096;
  static constexpr size_t MAX_CSS_SELECTOR_LENGTH = 256;

  std::map<std::string, CssStyle> styleMap_;
};
