#include "test_utils.h"

#include <Logging.h>

#include <string>
#include <vector>

#include "../../../src/anchor/AnchorCodec.h"

using folio::BlockMaps;
using folio::BlockPosition;
using folio::ChapterBlockMap;
using folio::ChapterPageRange;
using folio::Error;
using folio::ReadingAnchor;
using folio::StoredPosition;

namespace {

ChapterPageRange range(const uint32_t chapter, const uint32_t start, const uint32_t count, const bool measured) {
  ChapterPageRange r;
  r.chapterIndex = chapter;
  r.startPage = start;
  r.pageCount = count;
  r.measured = measured;
  return r;
}

BlockPosition block(const uint32_t index, const uint32_t page, const uint32_t offset, const uint32_t length,
                    const std::string& snippet) {
  BlockPosition b;
  b.blockIndex = index;
  b.pageInChapter = page;
  b.textOffset = offset;
  b.textLength = length;
  b.snippet = snippet;
  return b;
}

// Chapter 0: estimated, pages 0-1
// Chapter 1: measured, pages 2-4, one or two blocks per page
// Chapter 2: measured, pages 5-7, a long block spans pages 6 and 7
std::vector<ChapterPageRange> bookRanges() {
  return {range(0, 0, 2, false), range(1, 2, 3, true), range(2, 5, 3, true)};
}

BlockMaps bookMaps() {
  BlockMaps maps;
  ChapterBlockMap one;
  one.chapterIndex = 1;
  one.blocks = {block(0, 0, 0, 100, "Call me Ishmael. Som"), block(1, 0, 100, 50, "It was the best of t"),
                block(2, 1, 150, 80, "Happy families are a"), block(3, 2, 230, 70, "In a hole in the gro")};
  maps[1] = one;

  ChapterBlockMap two;
  two.chapterIndex = 2;
  two.blocks = {block(0, 0, 0, 40, "Chapter Two"), block(1, 1, 40, 900, "The long paragraph")};
  maps[2] = two;
  return maps;
}

}  // namespace

int main() {
  TestUtils::TestRunner runner("Anchor Codec");
  logSetSink(nullptr);

  // ============================================
  // Serialization
  // ============================================
  {
    ReadingAnchor anchor;
    anchor.chapterIndex = 3;
    anchor.blockIndex = 12;
    anchor.textSnippet = "Once upon a time";
    runner.expectEq(std::string("anchor:3:12:0|snippet:Once upon a time|char:25000"),
                    folio::serializeAnchor(anchor, 25000), "serialize: full form");

    anchor.textSnippet = "a|b";
    runner.expectEq(std::string("anchor:3:12:0|snippet:a b"), folio::serializeAnchor(anchor),
                    "serialize: pipes replaced, zero offset omitted");

    anchor.textSnippet.clear();
    runner.expectEq(std::string("anchor:3:12:0"), folio::serializeAnchor(anchor), "serialize: no snippet");
  }

  // ============================================
  // Deserialization
  // ============================================
  {
    const StoredPosition p = folio::deserializeAnchor("anchor:3:12:7|snippet:Once upon a time|char:25000");
    runner.expectTrue(p.hasAnchor, "parse: anchor present");
    runner.expectEq(uint32_t(3), p.anchor.chapterIndex, "parse: chapter");
    runner.expectEq(uint32_t(12), p.anchor.blockIndex, "parse: block");
    runner.expectEq(uint32_t(7), p.anchor.charOffset, "parse: char offset in chapter");
    runner.expectEq(std::string("Once upon a time"), p.anchor.textSnippet, "parse: snippet");
    runner.expectEq(uint32_t(25000), p.charOffset, "parse: global char offset");
    runner.expectEq(-1, p.pageNumber, "parse: no page");
  }
  {
    ReadingAnchor anchor;
    anchor.chapterIndex = 9;
    anchor.blockIndex = 4;
    anchor.charOffset = 120;
    anchor.textSnippet = "Snippet: with colons";
    const StoredPosition p = folio::deserializeAnchor(folio::serializeAnchor(anchor, 777));
    runner.expectTrue(p.hasAnchor && p.anchor == anchor, "parse: serialized anchor read back");
    runner.expectEq(uint32_t(777), p.charOffset, "parse: serialized offset read back");
  }
  {
    const StoredPosition p = folio::deserializeAnchor("snippet:Once upon a time|anchor:2:5:0");
    runner.expectTrue(p.hasAnchor, "order: anchor after snippet parsed");
    runner.expectEq(uint32_t(5), p.anchor.blockIndex, "order: anchor after snippet block");
    runner.expectEq(std::string("Once upon a time"), p.anchor.textSnippet, "order: snippet before anchor kept");

    const StoredPosition twice = folio::deserializeAnchor("anchor:1:1:0|snippet:kept|anchor:2:5:0");
    runner.expectEq(uint32_t(2), twice.anchor.chapterIndex, "order: last anchor wins");
    runner.expectEq(std::string("kept"), twice.anchor.textSnippet, "order: repeated anchor keeps snippet");

    const StoredPosition mixed = folio::deserializeAnchor("char:90|snippet:tail|page:4|anchor:0:0:3");
    runner.expectEq(std::string("tail"), mixed.anchor.textSnippet, "order: snippet first in mixed segments");
    runner.expectEq(uint32_t(90), mixed.charOffset, "order: char before anchor");
  }
  {
    const StoredPosition legacy = folio::deserializeAnchor("char:4200|page:17|fp:16_1.8_system_376_527");
    runner.expectFalse(legacy.hasAnchor, "legacy: no anchor");
    runner.expectEq(uint32_t(4200), legacy.charOffset, "legacy: char offset");
    runner.expectEq(17, legacy.pageNumber, "legacy: page");
    runner.expectEq(std::string("16_1.8_system_376_527"), legacy.settingsFingerprint, "legacy: fingerprint");

    const StoredPosition oldest = folio::deserializeAnchor("page:12/300");
    runner.expectEq(12, oldest.pageNumber, "oldest: page");
    runner.expectEq(uint32_t(300), oldest.legacyPageTotal, "oldest: total");
  }
  {
    const StoredPosition empty = folio::deserializeAnchor("");
    runner.expectFalse(empty.hasAnchor, "garbage: empty string");
    runner.expectEq(uint32_t(0), empty.charOffset, "garbage: empty string has no offset");

    const StoredPosition junk = folio::deserializeAnchor("hello|anchor:x:1:2|snippet:orphan|page:-3|char:abc");
    runner.expectFalse(junk.hasAnchor, "garbage: non-numeric anchor rejected");
    runner.expectEq(-1, junk.pageNumber, "garbage: negative page ignored");
    runner.expectEq(uint32_t(0), junk.charOffset, "garbage: non-numeric char ignored");

    runner.expectFalse(folio::deserializeAnchor("anchor:1:-2:0").hasAnchor, "garbage: negative field rejected");
    runner.expectFalse(folio::deserializeAnchor("anchor:1:2").hasAnchor, "garbage: missing field rejected");
    runner.expectTrue(folio::deserializeAnchor("anchor:1:2:3:extra").hasAnchor, "garbage: extra fields ignored");
  }

  // ============================================
  // Range lookup
  // ============================================
  {
    const std::vector<ChapterPageRange> ranges = bookRanges();
    const ChapterPageRange* r = folio::findRangeForPage(4, ranges);
    runner.expectTrue(r != nullptr && r->chapterIndex == 1, "range: page 4 in chapter 1");
    r = folio::findRangeForPage(5, ranges);
    runner.expectTrue(r != nullptr && r->chapterIndex == 2, "range: page 5 starts chapter 2");
    runner.expectTrue(folio::findRangeForPage(8, ranges) == nullptr, "range: past the end");
    runner.expectTrue(folio::findRangeForPage(0, {}) == nullptr, "range: no ranges");
    r = folio::findRangeForChapter(2, ranges);
    runner.expectTrue(r != nullptr && r->startPage == 5, "range: chapter lookup");
    runner.expectTrue(folio::findRangeForChapter(3, ranges) == nullptr, "range: unknown chapter");
  }

  // ============================================
  // Page to anchor
  // ============================================
  {
    const std::vector<ChapterPageRange> ranges = bookRanges();
    const BlockMaps maps = bookMaps();

    const auto first = folio::pageToAnchor(2, ranges, maps);
    runner.expectTrue(first.ok(), "to anchor: measured page");
    runner.expectEq(uint32_t(1), first.value.chapterIndex, "to anchor: chapter");
    runner.expectEq(uint32_t(0), first.value.blockIndex, "to anchor: first block on the page");
    runner.expectEq(std::string("Call me Ishmael. Som"), first.value.textSnippet, "to anchor: snippet");

    const auto third = folio::pageToAnchor(4, ranges, maps);
    runner.expectEq(uint32_t(3), third.value.blockIndex, "to anchor: later page");

    const auto spanned = folio::pageToAnchor(7, ranges, maps);
    runner.expectEq(uint32_t(1), spanned.value.blockIndex, "to anchor: page inside a long block");

    const auto estimated = folio::pageToAnchor(1, ranges, maps);
    runner.expectTrue(estimated.ok(), "to anchor: estimated chapter");
    runner.expectEq(uint32_t(0), estimated.value.chapterIndex, "to anchor: estimated chapter index");
    runner.expectTrue(estimated.value.textSnippet.empty(), "to anchor: chapter-level anchor");

    runner.expectEq(Error::OutOfRange, folio::pageToAnchor(99, ranges, maps).err, "to anchor: out of range");
  }

  // ============================================
  // Anchor to page
  // ============================================
  {
    const std::vector<ChapterPageRange> ranges = bookRanges();
    const BlockMaps maps = bookMaps();

    // Every page where a block starts survives the round trip
    for (const uint32_t page : {2u, 3u, 4u, 5u, 6u}) {
      const auto anchor = folio::pageToAnchor(page, ranges, maps);
      runner.expectEq(page, folio::anchorToPage(anchor.value, ranges, maps),
                      "round trip: page " + std::to_string(page));
    }

    ReadingAnchor a;
    a.chapterIndex = 1;
    a.blockIndex = 40;
    a.textSnippet = "Happy families are a";
    runner.expectEq(uint32_t(3), folio::anchorToPage(a, ranges, maps), "tier 2: exact snippet");

    a.textSnippet = "Happy families are all alike";
    runner.expectEq(uint32_t(3), folio::anchorToPage(a, ranges, maps), "tier 3: shared prefix");

    a.textSnippet = "Happy fam";
    runner.expectEq(uint32_t(3), folio::anchorToPage(a, ranges, maps), "tier 3: short snippet inside block");

    a.textSnippet = "Nothing like this";
    a.charOffset = 240;
    runner.expectEq(uint32_t(4), folio::anchorToPage(a, ranges, maps), "tier 4: proportional offset");

    a.charOffset = 0;
    runner.expectEq(uint32_t(2), folio::anchorToPage(a, ranges, maps), "fallback: chapter start");

    a.textSnippet = "";
    a.charOffset = 160;
    runner.expectEq(uint32_t(3), folio::anchorToPage(a, ranges, maps), "tier 4: empty snippet matches nothing");

    a.charOffset = 0;
    a.textSnippet = "Happy families differ";
    runner.expectEq(uint32_t(3), folio::anchorToPage(a, ranges, maps), "tier 3: default prefix");
    runner.expectEq(uint32_t(2), folio::anchorToPage(a, ranges, maps, 30), "tier 3: longer prefix is stricter");

    ReadingAnchor estimated;
    estimated.chapterIndex = 0;
    estimated.blockIndex = 5;
    runner.expectEq(uint32_t(0), folio::anchorToPage(estimated, ranges, maps), "no map: chapter start");

    ReadingAnchor unknown;
    unknown.chapterIndex = 42;
    runner.expectEq(uint32_t(0), folio::anchorToPage(unknown, ranges, maps), "unknown chapter: first page");

    // A block map from another layout never escapes the chapter
    BlockMaps stale = maps;
    stale[2].blocks[1].pageInChapter = 9;
    ReadingAnchor late;
    late.chapterIndex = 2;
    late.blockIndex = 1;
    runner.expectEq(uint32_t(7), folio::anchorToPage(late, ranges, stale), "clamp: stays in chapter");
  }

  logResetSink();
  return runner.allPassed() ? 0 : 1;
}
