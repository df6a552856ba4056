#pragma once

#include <cstdint>
#include <string>

namespace folio {

// Chapter window tuning
struct StreamConfig {
  uint32_t window = 8;             // chapters loaded on each side of the start chapter
  uint32_t prefetchThreshold = 4;  // distance from a loaded edge that triggers a prefetch
  uint32_t prefetchBatch = 8;      // chapters per prefetch
  uint32_t maxCache = 40;          // loaded chapters kept after eviction
};

/**
 * Reader configuration. Defaults match the reading surface; every field can
 * be overridden from an INI file:
 *
 *   [typography] font_size, line_height, font_family
 *   [page]       width, height, window
 *   [stream]     window, prefetch_threshold, prefetch_batch, max_cache
 *   [pagination] debounce_ms, cache_file
 *   [anchor]     fuzzy_prefix, snippet_length
 *   [progress]   debounce_ms
 */
struct ReaderSettings {
  float fontSize = 16.0f;
  float lineHeight = 1.8f;
  std::string fontFamily = "system";
  uint16_t pageWidth = 376;
  uint16_t pageHeight = 527;
  uint32_t pageWindow = 60;  // pages handed to the renderer around the current one

  StreamConfig stream;

  unsigned long paginationDebounceMs = 150;
  std::string measurementCacheFile;  // empty: in-memory only

  uint8_t fuzzyPrefix = 10;
  uint8_t snippetLength = 20;

  unsigned long progressDebounceMs = 300;

  bool loadFromIni(const char* path);
  bool loadFromString(const char* text);

 private:
  bool apply(const char* section, const char* key, const char* value);
};

}  // namespace folio
