#pragma once

#include <map>
#include <stdexcept>
#include <string>

#include "../../src/pagination/ChapterMeasurer.h"

/**
 * Measurer keyed on the chapter HTML. Unscripted HTML measures as one page
 * holding one block.
 */
class FakeChapterMeasurer : public folio::ChapterMeasurer {
 public:
  struct Script {
    uint32_t pageCount = 1;
    uint32_t blocksPerPage = 1;
    folio::Error err = folio::Error::Ok;
    bool throws = false;
  };

  void script(const std::string& html, const Script& s) { scripts_[html] = s; }

  void setPages(const std::string& html, const uint32_t pageCount, const uint32_t blocksPerPage = 1) {
    Script s;
    s.pageCount = pageCount;
    s.blocksPerPage = blocksPerPage;
    scripts_[html] = s;
  }

  void setError(const std::string& html, const folio::Error err) {
    Script s;
    s.err = err;
    scripts_[html] = s;
  }

  void setThrows(const std::string& html) {
    Script s;
    s.throws = true;
    scripts_[html] = s;
  }

  int calls = 0;
  folio::Typography lastTypography;
  uint16_t lastWidth = 0;
  uint16_t lastHeight = 0;

  folio::Result<folio::ChapterMeasurement> measureChapter(const std::string& html, const std::string& styles,
                                                          const folio::Typography& typography, const uint16_t width,
                                                          const uint16_t height) override {
    (void)styles;
    calls++;
    lastTypography = typography;
    lastWidth = width;
    lastHeight = height;

    Script s;
    const auto it = scripts_.find(html);
    if (it != scripts_.end()) s = it->second;
    if (s.throws) throw std::runtime_error("measurer exploded");
    if (s.err != folio::Error::Ok) return folio::Err<folio::ChapterMeasurement>(s.err);

    // Blocks of 10 characters, blocksPerPage on each page
    folio::ChapterMeasurement m;
    m.pageCount = s.pageCount;
    uint32_t index = 0;
    for (uint32_t page = 0; page < s.pageCount; page++) {
      for (uint32_t b = 0; b < s.blocksPerPage; b++) {
        folio::BlockPosition block;
        block.blockIndex = index;
        block.pageInChapter = page;
        block.textOffset = index * 10;
        block.textLength = 10;
        block.snippet = "block " + std::to_string(index);
        m.blocks.push_back(block);
        index++;
      }
    }
    return folio::Ok(std::move(m));
  }

 private:
  std::map<std::string, Script> scripts_;
};
