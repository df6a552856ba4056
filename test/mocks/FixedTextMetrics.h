#pragma once

#include <TextMetrics.h>
#include <Utf8.h>

// Every code point is charWidth pixels wide and a space is spaceWidth, whatever the font size
class FixedTextMetrics : public TextMetrics {
 public:
  explicit FixedTextMetrics(const int charWidth = 10, const int spaceWidth = 10)
      : charWidth_(charWidth), spaceWidth_(spaceWidth) {}

  int getTextWidth(const char* text, FontStyle style, float fontSize) const override {
    (void)style;
    (void)fontSize;
    const auto* p = reinterpret_cast<const unsigned char*>(text);
    int width = 0;
    while (utf8NextCodepoint(&p)) {
      width += charWidth_;
    }
    return width;
  }

  int getSpaceWidth(float fontSize) const override {
    (void)fontSize;
    return spaceWidth_;
  }

 private:
  int charWidth_;
  int spaceWidth_;
};
