#include "ReaderSettings.h"

#include <Logging.h>

#include <algorithm>
#include <cstring>

#include "IniParser.h"

#define TAG "CFG"

namespace folio {

namespace {

template <typename T>
T clampValue(const T value, const T lo, const T hi) {
  return std::max(lo, std::min(value, hi));
}

int clampedInt(const char* value, const int current, const int lo, const int hi) {
  return clampValue(IniParser::parseInt(value, current), lo, hi);
}

}  // namespace

bool ReaderSettings::loadFromIni(const char* path) {
  const bool ok = IniParser::parseFile(
      path, [this](const char* section, const char* key, const char* value) { return apply(section, key, value); });
  if (ok) {
    LOG_INF(TAG, "Loaded %s (font %g/%g %s, page %ux%u)", path, fontSize, lineHeight, fontFamily.c_str(), pageWidth,
            pageHeight);
  }
  return ok;
}

bool ReaderSettings::loadFromString(const char* text) {
  return IniParser::parseString(
      text, [this](const char* section, const char* key, const char* value) { return apply(section, key, value); });
}

bool ReaderSettings::apply(const char* section, const char* key, const char* value) {
  bool known = true;

  if (strcmp(section, "typography") == 0) {
    if (strcmp(key, "font_size") == 0) {
      fontSize = clampValue(IniParser::parseFloat(value, fontSize), 8.0f, 72.0f);
    } else if (strcmp(key, "line_height") == 0) {
      lineHeight = clampValue(IniParser::parseFloat(value, lineHeight), 1.0f, 3.0f);
    } else if (strcmp(key, "font_family") == 0) {
      if (value[0] != '\0') fontFamily = value;
    } else {
      known = false;
    }
  } else if (strcmp(section, "page") == 0) {
    if (strcmp(key, "width") == 0) {
      pageWidth = static_cast<uint16_t>(clampedInt(value, pageWidth, 200, 8192));
    } else if (strcmp(key, "height") == 0) {
      pageHeight = static_cast<uint16_t>(clampedInt(value, pageHeight, 200, 8192));
    } else if (strcmp(key, "window") == 0) {
      pageWindow = static_cast<uint32_t>(clampedInt(value, static_cast<int>(pageWindow), 1, 1000));
    } else {
      known = false;
    }
  } else if (strcmp(section, "stream") == 0) {
    if (strcmp(key, "window") == 0) {
      stream.window = static_cast<uint32_t>(clampedInt(value, static_cast<int>(stream.window), 1, 64));
    } else if (strcmp(key, "prefetch_threshold") == 0) {
      stream.prefetchThreshold =
          static_cast<uint32_t>(clampedInt(value, static_cast<int>(stream.prefetchThreshold), 0, 64));
    } else if (strcmp(key, "prefetch_batch") == 0) {
      stream.prefetchBatch = static_cast<uint32_t>(clampedInt(value, static_cast<int>(stream.prefetchBatch), 1, 64));
    } else if (strcmp(key, "max_cache") == 0) {
      stream.maxCache = static_cast<uint32_t>(clampedInt(value, static_cast<int>(stream.maxCache), 1, 1024));
    } else {
      known = false;
    }
  } else if (strcmp(section, "pagination") == 0) {
    if (strcmp(key, "debounce_ms") == 0) {
      paginationDebounceMs =
          static_cast<unsigned long>(clampedInt(value, static_cast<int>(paginationDebounceMs), 0, 5000));
    } else if (strcmp(key, "cache_file") == 0) {
      measurementCacheFile = value;
    } else {
      known = false;
    }
  } else if (strcmp(section, "anchor") == 0) {
    if (strcmp(key, "fuzzy_prefix") == 0) {
      fuzzyPrefix = static_cast<uint8_t>(clampedInt(value, fuzzyPrefix, 1, 64));
    } else if (strcmp(key, "snippet_length") == 0) {
      snippetLength = static_cast<uint8_t>(clampedInt(value, snippetLength, 1, 200));
    } else {
      known = false;
    }
  } else if (strcmp(section, "progress") == 0) {
    if (strcmp(key, "debounce_ms") == 0) {
      progressDebounceMs =
          static_cast<unsigned long>(clampedInt(value, static_cast<int>(progressDebounceMs), 0, 60000));
    } else {
      known = false;
    }
  } else {
    known = false;
  }

  if (!known) {
    LOG_INF(TAG, "Ignoring unknown setting [%s] %s", section, key);
  }
  return true;
}

}  // namespace folio
