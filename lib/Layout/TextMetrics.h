#pragma once

#include <cstdint>
#include <string>

enum class FontStyle : uint8_t {
  Regular,
  Bold,
  Italic,
  BoldItalic,
};

enum class FontClass : uint8_t {
  SansSerif,
  Serif,
  Monospace,
};

/**
 * Width source for line breaking. Implementations may wrap a real shaper;
 * the layout code only needs advances in pixels.
 */
class TextMetrics {
 public:
  virtual ~TextMetrics() = default;

  virtual int getTextWidth(const char* text, FontStyle style, float fontSize) const = 0;
  virtual int getSpaceWidth(float fontSize) const = 0;
};

/**
 * Advance widths estimated per code point from the font class, without font files.
 * Latin text averages about half an em per glyph; CJK glyphs are a full em.
 */
class EstimatedTextMetrics : public TextMetrics {
 public:
  explicit EstimatedTextMetrics(FontClass fontClass) : fontClass_(fontClass) {}

  // Maps a CSS font-family list or reader setting ("serif", "Courier New, monospace") to a class
  static FontClass classify(const std::string& fontFamily);

  int getTextWidth(const char* text, FontStyle style, float fontSize) const override;
  int getSpaceWidth(float fontSize) const override;

  FontClass fontClass() const { return fontClass_; }

 private:
  float averageAdvance() const;

  FontClass fontClass_;
};
