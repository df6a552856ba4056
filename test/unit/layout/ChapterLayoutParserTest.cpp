#include "test_utils.h"

#include <ChapterLayoutParser.h>
#include <CssParser.h>
#include <TextMetrics.h>

#include <string>

#include "FixedTextMetrics.h"

namespace {

// 10px font, 20px lines, 100x100 columns: five lines per column
LayoutConfig smallColumns() { return LayoutConfig(10.0f, 2.0f, 100, 100); }

std::string paragraphs(const int count, const std::string& text) {
  std::string html = "<body>";
  for (int i = 0; i < count; i++) {
    html += "<p>" + text + "</p>\n";
  }
  return html + "</body>";
}

}  // namespace

int main() {
  TestUtils::TestRunner runner("Chapter Layout Parser");
  const FixedTextMetrics metrics(10, 10);

  // ============================================
  // Column filling
  // ============================================

  // Test 1: Paragraph margins collapse and vanish at the top of a column
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    runner.expectTrue(parser.parse(paragraphs(6, "abcd")), "paragraphs: parsed");
    const ChapterLayout& layout = parser.getLayout();
    runner.expectEq(uint32_t(2), layout.pageCount, "paragraphs: three per column with margins");
    runner.expectEq(size_t(6), layout.blocks.size(), "paragraphs: one block each");
    if (layout.blocks.size() == 6) {
      runner.expectEq(uint32_t(0), layout.blocks[2].pageInChapter, "paragraphs: third on first column");
      runner.expectEq(uint32_t(1), layout.blocks[3].pageInChapter, "paragraphs: fourth starts second column");
      runner.expectEq(uint32_t(12), layout.blocks[3].textOffset, "paragraphs: text offset of fourth");
      runner.expectEq(uint32_t(4), layout.blocks[3].textLength, "paragraphs: text length");
      runner.expectEq(std::string("abcd"), layout.blocks[0].snippet, "paragraphs: snippet");
    }
    runner.expectEq(uint32_t(24), layout.textLength, "paragraphs: total text length");
  }

  // Test 2: Stylesheet margins replace the defaults
  {
    CssParser css;
    css.parseString("p { margin: 0 }");
    ChapterLayoutParser parser(metrics, smallColumns(), &css);
    runner.expectTrue(parser.parse(paragraphs(6, "abcd")), "no margins: parsed");
    const ChapterLayout& layout = parser.getLayout();
    runner.expectEq(uint32_t(2), layout.pageCount, "no margins: two columns");
    if (layout.blocks.size() == 6) {
      runner.expectEq(uint32_t(0), layout.blocks[4].pageInChapter, "no margins: five lines fit a column");
      runner.expectEq(uint32_t(1), layout.blocks[5].pageInChapter, "no margins: sixth overflows");
    }
  }

  // Test 3: Greedy line breaking
  {
    std::string words;
    for (int i = 0; i < 12; i++) words += (i ? " " : "") + std::string("aaaa");
    ChapterLayoutParser parser(metrics, smallColumns());
    runner.expectTrue(parser.parse("<body><p>" + words + "</p></body>"), "wrapping: parsed");
    const ChapterLayout& layout = parser.getLayout();
    runner.expectEq(uint32_t(2), layout.pageCount, "wrapping: two words per line, six lines");
    runner.expectEq(size_t(1), layout.blocks.size(), "wrapping: one block");
    if (!layout.blocks.empty()) {
      runner.expectEq(uint32_t(59), layout.blocks[0].textLength, "wrapping: words joined by single spaces");
      runner.expectEq(uint32_t(0), layout.blocks[0].pageInChapter, "wrapping: block starts on first column");
    }
  }

  // Test 4: Headings are larger and bold
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    runner.expectTrue(parser.parse("<body><h1>Title</h1><p>abcd</p></body>"), "heading: parsed");
    const ChapterLayout& layout = parser.getLayout();
    runner.expectEq(uint32_t(1), layout.pageCount, "heading: fits one column");
    runner.expectEq(size_t(2), layout.blocks.size(), "heading: heading and paragraph");
    if (!layout.blocks.empty()) runner.expectEq(std::string("Title"), layout.blocks[0].snippet, "heading: snippet");
  }

  // ============================================
  // Skipped content
  // ============================================
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    runner.expectTrue(parser.parse("<body><head><title>T</title></head><p>abc</p>"
                                   "<p style=\"display:none\">hidden</p>"
                                   "<div role=\"doc-pagebreak\">12</div>"
                                   "<span epub:type=\"pagebreak\">13</span>"
                                   "<script>var x = 1;</script><p>def</p></body>"),
                      "skip: parsed");
    const ChapterLayout& layout = parser.getLayout();
    runner.expectEq(size_t(2), layout.blocks.size(), "skip: only visible paragraphs");
    runner.expectEq(uint32_t(6), layout.textLength, "skip: hidden text not counted");
    if (layout.blocks.size() == 2) runner.expectEq(std::string("def"), layout.blocks[1].snippet, "skip: second block");
  }

  // ============================================
  // Leaf blocks
  // ============================================
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    parser.parse("<body><div><p>ab</p><p>cd</p></div><div>plain text</div></body>");
    const ChapterLayout& layout = parser.getLayout();
    runner.expectEq(size_t(3), layout.blocks.size(), "leaf: wrapper div not recorded");
    if (layout.blocks.size() == 3) {
      runner.expectEq(uint32_t(10), layout.blocks[2].textLength, "leaf: div without block children recorded");
      runner.expectEq(uint32_t(4), layout.blocks[2].textOffset, "leaf: offsets are cumulative");
    }
  }

  // Without any leaf block the whole chapter is one block
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    runner.expectTrue(parser.parse("<body>just text<span>more</span></body>"), "no blocks: parsed");
    const ChapterLayout& layout = parser.getLayout();
    runner.expectEq(size_t(1), layout.blocks.size(), "no blocks: single block");
    runner.expectEq(uint32_t(13), layout.textLength, "no blocks: inline runs join without a space");
  }

  // Empty chapter
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    runner.expectTrue(parser.parse("<body></body>"), "empty: parsed");
    runner.expectEq(uint32_t(1), parser.getLayout().pageCount, "empty: still one page");
    runner.expectEq(uint32_t(0), parser.getLayout().textLength, "empty: no text");
  }

  // ============================================
  // Line breaks, preformatted text and images
  // ============================================
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    parser.parse("<body><p>a<br/><br/><br/><br/><br/>b</p></body>");
    runner.expectEq(uint32_t(2), parser.getLayout().pageCount, "br: consecutive breaks leave blank lines");
  }
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    parser.parse("<body><pre>\n1\n2\n3\n4\n5</pre></body>");
    runner.expectEq(uint32_t(1), parser.getLayout().pageCount, "pre: newline after <pre> ignored, five lines fit");
  }
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    parser.parse("<body><pre>\n1\n2\n3\n4\n5\n6</pre></body>");
    runner.expectEq(uint32_t(2), parser.getLayout().pageCount, "pre: each newline is a line");
  }
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    parser.parse("<body><p>a</p><img src=\"x.png\" height=\"90\"/><p>b</p></body>");
    const ChapterLayout& layout = parser.getLayout();
    runner.expectEq(uint32_t(3), layout.pageCount, "img: tall image takes its own column");
    if (layout.blocks.size() == 2) runner.expectEq(uint32_t(2), layout.blocks[1].pageInChapter, "img: text after it");
  }
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    parser.parse("<body><p>a</p><img src=\"rule.png\" height=\"2\"/><p>b</p></body>");
    runner.expectEq(uint32_t(1), parser.getLayout().pageCount, "img: decorative image ignored");
  }

  // ============================================
  // Entities, snippets, errors
  // ============================================
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    runner.expectTrue(parser.parse("<body><p>a&nbsp;b &mdash; c &amp; d</p></body>"),
                      "entities: HTML entities accepted");
    runner.expectEq(uint32_t(11), parser.getLayout().textLength, "entities: each counts as one character");
  }
  {
    LayoutConfig config = smallColumns();
    config.snippetLength = 5;
    ChapterLayoutParser parser(metrics, config);
    parser.parse("<body><p>Hello   world</p></body>");
    if (!parser.getLayout().blocks.empty()) {
      runner.expectEq(std::string("Hello"), parser.getLayout().blocks[0].snippet, "snippet: limited length");
    }
    runner.expectEq(uint32_t(11), parser.getLayout().textLength, "snippet: whitespace collapsed in length");
  }
  {
    // Unbroken CJK text outgrows the word buffer; the cut must not split a character or add a space
    std::string han;
    for (int i = 0; i < 100; i++) han += "\xE4\xB8\xAD";
    ChapterLayoutParser parser(metrics, smallColumns());
    runner.expectTrue(parser.parse("<body><p>" + han + "</p></body>"), "cjk: parsed");
    const ChapterLayout& layout = parser.getLayout();
    runner.expectEq(uint32_t(100), layout.textLength, "cjk: length counts code points only");
    if (layout.blocks.size() == 1) {
      runner.expectEq(uint32_t(100), layout.blocks[0].textLength, "cjk: block length");
      runner.expectEq(han.substr(0, 60), layout.blocks[0].snippet, "cjk: snippet is whole characters");
    }

    std::string latin(450, 'x');
    parser.parse("<body><p>" + latin + " tail</p></body>");
    runner.expectEq(uint32_t(455), parser.getLayout().textLength, "long word: pieces joined without spaces");
  }
  {
    ChapterLayoutParser parser(metrics, smallColumns());
    runner.expectFalse(parser.parse("<body><p>unclosed</body>"), "malformed: rejected");
    runner.expectTrue(parser.errorMessage().compare(0, 5, "line ") == 0, "malformed: message has a line number");
    runner.expectTrue(parser.parse("<body><p>ok</p></body>"), "malformed: parser reusable afterwards");
    runner.expectTrue(parser.errorMessage().empty(), "malformed: error cleared");
  }

  // ============================================
  // Estimated metrics
  // ============================================
  runner.expectTrue(EstimatedTextMetrics::classify("Courier New, monospace") == FontClass::Monospace,
                    "classify: monospace");
  runner.expectTrue(EstimatedTextMetrics::classify("Georgia") == FontClass::Serif, "classify: serif by name");
  runner.expectTrue(EstimatedTextMetrics::classify("sans-serif") == FontClass::SansSerif, "classify: sans-serif");
  runner.expectTrue(EstimatedTextMetrics::classify("system") == FontClass::SansSerif, "classify: default");
  {
    const EstimatedTextMetrics mono(FontClass::Monospace);
    const int monoWidth = mono.getTextWidth("aaaaaaaaaa", FontStyle::Regular, 10.0f);
    runner.expectTrue(monoWidth >= 60 && monoWidth <= 61, "estimate: monospace advance");
    runner.expectTrue(mono.getTextWidth("\xE4\xB8\xAD", FontStyle::Regular, 10.0f) == 10, "estimate: CJK is one em");
    const EstimatedTextMetrics sans(FontClass::SansSerif);
    const int regular = sans.getTextWidth("mmm", FontStyle::Regular, 10.0f);
    runner.expectTrue(sans.getTextWidth("mmm", FontStyle::Bold, 10.0f) > regular, "estimate: bold is wider");
    runner.expectTrue(sans.getTextWidth("iii", FontStyle::Regular, 10.0f) < regular, "estimate: narrow glyphs");
  }

  return runner.allPassed() ? 0 : 1;
}
