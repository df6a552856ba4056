#include "test_utils.h"

#include <cstdio>
#include <string>
#include <vector>

#include "../../../src/config/IniParser.h"
#include "../../../src/config/ReaderSettings.h"

using folio::ReaderSettings;

int main() {
  TestUtils::TestRunner runner("Reader Settings");

  // ============================================
  // IniParser
  // ============================================
  {
    std::vector<std::string> seen;
    const bool ok = IniParser::parseString(
        "# comment\n"
        "top = 1\n"
        "[alpha]\n"
        "  key =  value with spaces  \n"
        "; another comment\n"
        "\n"
        "[beta]\n"
        "flag=yes\n"
        "broken line\n",
        [&](const char* section, const char* key, const char* value) {
          seen.push_back(std::string(section) + "|" + key + "|" + value);
          return true;
        });
    runner.expectTrue(ok, "ini: parsed");
    runner.expectEq(size_t(3), seen.size(), "ini: three pairs, malformed line ignored");
    if (seen.size() == 3) {
      runner.expectEq(std::string("|top|1"), seen[0], "ini: key before any section");
      runner.expectEq(std::string("alpha|key|value with spaces"), seen[1], "ini: trimmed key and value");
      runner.expectEq(std::string("beta|flag|yes"), seen[2], "ini: no spaces around '='");
    }
  }
  {
    int calls = 0;
    IniParser::parseString("[a]\nx=1\ny=2\nz=3\n", [&](const char*, const char*, const char*) {
      calls++;
      return calls < 2;
    });
    runner.expectEq(2, calls, "ini: callback can stop parsing");
  }
  runner.expectTrue(IniParser::parseBool("yes"), "parseBool: yes");
  runner.expectTrue(IniParser::parseBool("ON"), "parseBool: ON");
  runner.expectFalse(IniParser::parseBool("0", true), "parseBool: 0");
  runner.expectTrue(IniParser::parseBool("maybe", true), "parseBool: unknown uses default");
  runner.expectEq(42, IniParser::parseInt("42"), "parseInt: plain");
  runner.expectEq(-3, IniParser::parseInt("-3"), "parseInt: negative");
  runner.expectEq(7, IniParser::parseInt("x", 7), "parseInt: invalid uses default");
  runner.expectFloatEq(1.5f, IniParser::parseFloat("1.5"), "parseFloat: plain");
  runner.expectFloatEq(2.0f, IniParser::parseFloat("", 2.0f), "parseFloat: empty uses default");
  runner.expectFalse(IniParser::parseFile("/nonexistent/folio.ini", [](const char*, const char*, const char*) {
    return true;
  }),
                     "parseFile: missing file");

  // ============================================
  // Defaults
  // ============================================
  {
    const ReaderSettings s;
    runner.expectFloatEq(16.0f, s.fontSize, "defaults: font size");
    runner.expectFloatEq(1.8f, s.lineHeight, "defaults: line height");
    runner.expectEq(std::string("system"), s.fontFamily, "defaults: font family");
    runner.expectEq(376, static_cast<int>(s.pageWidth), "defaults: page width");
    runner.expectEq(527, static_cast<int>(s.pageHeight), "defaults: page height");
    runner.expectEq(60u, s.pageWindow, "defaults: page window");
    runner.expectEq(8u, s.stream.window, "defaults: window");
    runner.expectEq(4u, s.stream.prefetchThreshold, "defaults: prefetch threshold");
    runner.expectEq(8u, s.stream.prefetchBatch, "defaults: prefetch batch");
    runner.expectEq(40u, s.stream.maxCache, "defaults: max cache");
    runner.expectEq(150ul, s.paginationDebounceMs, "defaults: pagination debounce");
    runner.expectEq(300ul, s.progressDebounceMs, "defaults: progress debounce");
    runner.expectEq(10, static_cast<int>(s.fuzzyPrefix), "defaults: fuzzy prefix");
    runner.expectEq(20, static_cast<int>(s.snippetLength), "defaults: snippet length");
    runner.expectTrue(s.measurementCacheFile.empty(), "defaults: no cache file");
  }

  // ============================================
  // Overrides and clamping
  // ============================================
  {
    ReaderSettings s;
    runner.expectTrue(s.loadFromString("[typography]\n"
                                       "font_size = 20\n"
                                       "line_height = 1.5\n"
                                       "font_family = serif\n"
                                       "[page]\n"
                                       "width = 600\n"
                                       "height = 100\n"
                                       "window = 0\n"
                                       "[stream]\n"
                                       "window = 2\n"
                                       "max_cache = 5000\n"
                                       "[pagination]\n"
                                       "debounce_ms = 0\n"
                                       "cache_file = /tmp/folio.cache\n"
                                       "[anchor]\n"
                                       "fuzzy_prefix = 6\n"
                                       "[progress]\n"
                                       "debounce_ms = 1000\n"
                                       "[unknown]\n"
                                       "whatever = 1\n"
                                       "[typography]\n"
                                       "kerning = on\n"),
                      "load: parsed");
    runner.expectFloatEq(20.0f, s.fontSize, "load: font size");
    runner.expectFloatEq(1.5f, s.lineHeight, "load: line height");
    runner.expectEq(std::string("serif"), s.fontFamily, "load: font family");
    runner.expectEq(600, static_cast<int>(s.pageWidth), "load: width");
    runner.expectEq(200, static_cast<int>(s.pageHeight), "load: height clamped to minimum");
    runner.expectEq(1u, s.pageWindow, "load: page window clamped to minimum");
    runner.expectEq(2u, s.stream.window, "load: window");
    runner.expectEq(1024u, s.stream.maxCache, "load: max cache clamped");
    runner.expectEq(8u, s.stream.prefetchBatch, "load: untouched key keeps default");
    runner.expectEq(0ul, s.paginationDebounceMs, "load: debounce may be zero");
    runner.expectEq(std::string("/tmp/folio.cache"), s.measurementCacheFile, "load: cache file");
    runner.expectEq(6, static_cast<int>(s.fuzzyPrefix), "load: fuzzy prefix");
    runner.expectEq(1000ul, s.progressDebounceMs, "load: progress debounce");
  }
  {
    ReaderSettings s;
    s.loadFromString("[typography]\nfont_size = huge\nline_height = 9\n");
    runner.expectFloatEq(16.0f, s.fontSize, "invalid: unparsable keeps current value");
    runner.expectFloatEq(3.0f, s.lineHeight, "invalid: clamped to maximum");
  }

  // Test: loading from a file
  {
    const char* path = "folio_settings_test.ini";
    FILE* f = fopen(path, "w");
    if (f) {
      fputs("[typography]\nfont_size = 12\n", f);
      fclose(f);
    }
    ReaderSettings s;
    runner.expectTrue(s.loadFromIni(path), "file: loaded");
    runner.expectFloatEq(12.0f, s.fontSize, "file: value applied");
    remove(path);
    runner.expectFalse(s.loadFromIni(path), "file: missing file reported");
  }

  return runner.allPassed() ? 0 : 1;
}
