#include "test_utils.h"

#include <Utf8.h>

#include <string>

int main() {
  TestUtils::TestRunner runner("UTF-8");

  // ============================================
  // utf8NextCodepoint()
  // ============================================

  // Test 1: ASCII, 2-, 3- and 4-byte sequences
  {
    const std::string s = "a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80";  // a é € 😀
    const auto* p = reinterpret_cast<const unsigned char*>(s.c_str());
    runner.expectEq(uint32_t('a'), utf8NextCodepoint(&p), "decode: ASCII");
    runner.expectEq(uint32_t(0xE9), utf8NextCodepoint(&p), "decode: 2-byte");
    runner.expectEq(uint32_t(0x20AC), utf8NextCodepoint(&p), "decode: 3-byte");
    runner.expectEq(uint32_t(0x1F600), utf8NextCodepoint(&p), "decode: 4-byte");
    runner.expectEq(uint32_t(0), utf8NextCodepoint(&p), "decode: terminator");
  }

  // Test 2: Malformed bytes decode as U+FFFD
  {
    const std::string s = "\xFF" "b";
    const auto* p = reinterpret_cast<const unsigned char*>(s.c_str());
    runner.expectEq(uint32_t(0xFFFD), utf8NextCodepoint(&p), "malformed: invalid lead byte");
    runner.expectEq(uint32_t('b'), utf8NextCodepoint(&p), "malformed: resyncs after one byte");
  }

  // Test 3: Truncated sequence resyncs on the offending byte
  {
    const std::string s = "\xE2\x82" "c";
    const auto* p = reinterpret_cast<const unsigned char*>(s.c_str());
    runner.expectEq(uint32_t(0xFFFD), utf8NextCodepoint(&p), "truncated: replacement");
    runner.expectEq(uint32_t('c'), utf8NextCodepoint(&p), "truncated: next char intact");
  }

  // ============================================
  // utf8CodepointCount() / utf8Prefix()
  // ============================================

  runner.expectEq(size_t(0), utf8CodepointCount(""), "count: empty");
  runner.expectEq(size_t(5), utf8CodepointCount("hello"), "count: ASCII");
  runner.expectEq(size_t(4), utf8CodepointCount("caf\xC3\xA9"), "count: multibyte counts once");
  runner.expectEq(size_t(2), utf8CodepointCount("\xE4\xB8\xAD\xE6\x96\x87"), "count: CJK");

  runner.expectEq(std::string("caf"), utf8Prefix("caf\xC3\xA9", 3), "prefix: stops before multibyte");
  runner.expectEq(std::string("caf\xC3\xA9"), utf8Prefix("caf\xC3\xA9", 4), "prefix: includes whole sequence");
  runner.expectEq(std::string("abc"), utf8Prefix("abc", 10), "prefix: longer than string");
  runner.expectEq(std::string(""), utf8Prefix("abc", 0), "prefix: zero");

  // ============================================
  // utf8RemoveLastChar()
  // ============================================
  {
    std::string s = "a\xC3\xA9";
    runner.expectEq(size_t(1), utf8RemoveLastChar(s), "removeLast: multibyte removed whole");
    runner.expectEq(std::string("a"), s, "removeLast: remainder");
    runner.expectEq(size_t(0), utf8RemoveLastChar(s), "removeLast: last char");
    runner.expectEq(size_t(0), utf8RemoveLastChar(s), "removeLast: empty stays empty");
  }

  // ============================================
  // Classification
  // ============================================
  runner.expectTrue(utf8IsCombiningMark(0x0301), "combining: acute accent");
  runner.expectFalse(utf8IsCombiningMark('a'), "combining: letter");
  runner.expectTrue(utf8IsWide(0x4E2D), "wide: CJK ideograph");
  runner.expectTrue(utf8IsWide(0xAC00), "wide: Hangul syllable");
  runner.expectFalse(utf8IsWide('A'), "wide: Latin");

  return runner.allPassed() ? 0 : 1;
}
