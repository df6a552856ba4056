#include "test_utils.h"

#include <Logging.h>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>

#include "../../../src/pagination/MeasurementCache.h"

using folio::BlockPosition;
using folio::ChapterMeasurement;
using folio::MeasurementCache;

namespace {

const char* CACHE_FILE = "folio_measurement_cache_test.bin";

ChapterMeasurement measurement(const uint32_t pages, const std::string& snippet) {
  ChapterMeasurement m;
  m.pageCount = pages;
  for (uint32_t i = 0; i < pages; i++) {
    BlockPosition b;
    b.blockIndex = i;
    b.pageInChapter = i;
    b.textOffset = i * 40;
    b.textLength = 40;
    b.snippet = snippet + std::to_string(i);
    m.blocks.push_back(b);
  }
  return m;
}

}  // namespace

int main() {
  TestUtils::TestRunner runner("Measurement Cache");
  logSetSink(nullptr);
  std::remove(CACHE_FILE);

  // ============================================
  // Test 1: Content hash
  // ============================================
  {
    const uint64_t a = MeasurementCache::hashContent("<p>a</p>", "");
    runner.expectEq(a, MeasurementCache::hashContent("<p>a</p>", ""), "hash: stable");
    runner.expectTrue(a != MeasurementCache::hashContent("<p>b</p>", ""), "hash: html changes it");
    runner.expectTrue(a != MeasurementCache::hashContent("<p>a</p>", "p{}"), "hash: styles change it");
    runner.expectTrue(MeasurementCache::hashContent("ab", "c") != MeasurementCache::hashContent("a", "bc"),
                      "hash: boundary between html and styles matters");
  }

  // ============================================
  // Test 2: Lookup and rebinding
  // ============================================
  {
    MeasurementCache cache;
    cache.bind("16_1.8_system_376_527");
    cache.put(3, 111, measurement(2, "x"));

    const ChapterMeasurement* hit = cache.find(3, 111);
    runner.expectTrue(hit != nullptr, "find: hit");
    if (hit) runner.expectEq(uint32_t(2), hit->pageCount, "find: stored measurement");
    runner.expectTrue(cache.find(3, 222) == nullptr, "find: stale hash misses");
    runner.expectTrue(cache.find(4, 111) == nullptr, "find: other chapter misses");

    cache.bind("16_1.8_system_376_527");
    runner.expectEq(size_t(1), cache.size(), "bind: same fingerprint keeps entries");
    cache.bind("18_1.8_system_376_527");
    runner.expectEq(size_t(0), cache.size(), "bind: new fingerprint drops entries");
    runner.expectFalse(cache.save(), "save: no path configured");
  }

  // ============================================
  // Test 3: Persistence
  // ============================================
  {
    MeasurementCache cache(CACHE_FILE);
    cache.bind("16_1.8_system_376_527");
    cache.put(0, 10, measurement(3, "zero "));
    cache.put(7, 70, measurement(1, "seven "));
    runner.expectTrue(cache.save(), "save: written");

    MeasurementCache restored(CACHE_FILE);
    restored.bind("16_1.8_system_376_527");
    runner.expectTrue(restored.load(), "load: accepted");
    runner.expectEq(size_t(2), restored.size(), "load: entry count");
    const ChapterMeasurement* zero = restored.find(0, 10);
    runner.expectTrue(zero != nullptr, "load: entry found by hash");
    if (zero && zero->blocks.size() == 3) {
      runner.expectEq(uint32_t(2), zero->blocks[2].blockIndex, "load: block index rebuilt");
      runner.expectEq(uint32_t(80), zero->blocks[2].textOffset, "load: text offset");
      runner.expectEq(std::string("zero 2"), zero->blocks[2].snippet, "load: snippet");
    }

    MeasurementCache other(CACHE_FILE);
    other.bind("20_1.8_system_376_527");
    other.put(1, 1, measurement(1, "keep"));
    runner.expectFalse(other.load(), "load: other fingerprint rejected");
    runner.expectEq(size_t(1), other.size(), "load: rejected file leaves entries alone");

    MeasurementCache missing("folio_no_such_cache.bin");
    missing.bind("16_1.8_system_376_527");
    runner.expectFalse(missing.load(), "load: missing file");
  }

  // ============================================
  // Test 4: Damaged files
  // ============================================
  {
    {
      std::ofstream out(CACHE_FILE, std::ios::binary | std::ios::trunc);
      out.put(static_cast<char>(99));
    }
    MeasurementCache cache(CACHE_FILE);
    cache.bind("16_1.8_system_376_527");
    runner.expectFalse(cache.load(), "damaged: unknown version");

    MeasurementCache writer(CACHE_FILE);
    writer.bind("16_1.8_system_376_527");
    writer.put(0, 10, measurement(4, "block"));
    runner.expectTrue(writer.save(), "damaged: fresh file written");
    std::string bytes;
    {
      std::ifstream in(CACHE_FILE, std::ios::binary);
      bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    {
      std::ofstream out(CACHE_FILE, std::ios::binary | std::ios::trunc);
      out.write(bytes.data(), static_cast<std::streamsize>(bytes.size() - 5));
    }
    MeasurementCache truncated(CACHE_FILE);
    truncated.bind("16_1.8_system_376_527");
    runner.expectFalse(truncated.load(), "damaged: truncated file rejected");
    runner.expectEq(size_t(0), truncated.size(), "damaged: nothing half-loaded");

    MeasurementCache empty(CACHE_FILE);
    empty.bind("16_1.8_system_376_527");
    empty.put(0, 10, measurement(2, "ok"));
    empty.put(1, 11, measurement(0, "none"));
    runner.expectTrue(empty.save(), "damaged: zero-page entry written");
    MeasurementCache zeroPages(CACHE_FILE);
    zeroPages.bind("16_1.8_system_376_527");
    runner.expectFalse(zeroPages.load(), "damaged: zero-page entry rejected");
    runner.expectTrue(zeroPages.find(0, 10) == nullptr, "damaged: valid entries not half-loaded");
  }

  std::remove(CACHE_FILE);
  logResetSink();
  return runner.allPassed() ? 0 : 1;
}
