#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "ChapterMeasurer.h"

namespace folio {

/**
 * Per-chapter measurements for one settings fingerprint, optionally persisted.
 *
 * File layout:
 * - version (1 byte)
 * - fingerprint (string)
 * - entry count (4 bytes)
 * - per entry: chapterIndex (4), contentHash (8), pageCount (4), block count (4),
 *   per block: pageInChapter (4), textOffset (4), textLength (4), snippet (string)
 */
class MeasurementCache {
 public:
  explicit MeasurementCache(std::string cachePath = "");

  // Switch to another fingerprint; entries measured under a different one are dropped
  void bind(const std::string& fingerprint);
  const std::string& fingerprint() const { return fingerprint_; }

  const ChapterMeasurement* find(uint32_t chapterIndex, uint64_t contentHash) const;
  void put(uint32_t chapterIndex, uint64_t contentHash, const ChapterMeasurement& measurement);

  size_t size() const { return entries_.size(); }
  void clear() { entries_.clear(); }

  // Replace the in-memory entries with the file's, if it matches the bound fingerprint
  bool load();
  bool save() const;

  static uint64_t hashContent(const std::string& html, const std::string& styles);

 private:
  struct Entry {
    uint64_t contentHash = 0;
    ChapterMeasurement measurement;
  };

  static constexpr uint32_t MAX_ENTRIES = 100000;
  static constexpr uint32_t MAX_BLOCKS = 1000000;

  std::string cachePath_;
  std::string fingerprint_;
  std::map<uint32_t, Entry> entries_;
};

}  // namespace folio
