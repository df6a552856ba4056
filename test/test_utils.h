#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <string>
#include <type_traits>

namespace TestUtils {

/**
 * Minimal assertion runner for the standalone test executables.
 * Every check prints one line; main() returns allPassed() ? 0 : 1.
 */
class TestRunner {
 public:
  explicit TestRunner(const std::string& suiteName) : suiteName_(suiteName) {
    printf("\n========================================\n");
    printf("Test Suite: %s\n", suiteName_.c_str());
    printf("========================================\n");
  }

  ~TestRunner() { printSummary(); }

  bool expectTrue(const bool condition, const std::string& testName) {
    record(condition, testName, "");
    return condition;
  }

  bool expectFalse(const bool condition, const std::string& testName) {
    record(!condition, testName, "expected false");
    return !condition;
  }

  template <typename T, typename U>
  bool expectEq(const T& expected, const U& actual, const std::string& testName) {
    const bool ok = expected == actual;
    if (!ok) {
      std::ostringstream detail;
      detail << "expected " << printable(expected) << ", got " << printable(actual);
      record(false, testName, detail.str());
    } else {
      record(true, testName, "");
    }
    return ok;
  }

  bool expectFloatEq(const double expected, const double actual, const std::string& testName,
                     const double epsilon = 1e-4) {
    const bool ok = std::fabs(expected - actual) <= epsilon;
    std::ostringstream detail;
    if (!ok) detail << "expected " << expected << ", got " << actual;
    record(ok, testName, detail.str());
    return ok;
  }

  void printSummary() {
    if (summarized_) return;
    summarized_ = true;
    printf("\n----------------------------------------\n");
    printf("%s: %d passed, %d failed\n", suiteName_.c_str(), passed_, failed_);
    printf("----------------------------------------\n");
  }

  bool allPassed() const { return failed_ == 0; }
  int passCount() const { return passed_; }
  int failCount() const { return failed_; }

 private:
  template <typename T>
  static typename std::enable_if<!std::is_enum<T>::value, const T&>::type printable(const T& value) {
    return value;
  }
  template <typename T>
  static typename std::enable_if<std::is_enum<T>::value, long long>::type printable(const T& value) {
    return static_cast<long long>(value);
  }
  // Print small integers as numbers rather than characters
  static int printable(const uint8_t& value) { return value; }
  static int printable(const int8_t& value) { return value; }
  static int printable(const bool& value) { return value ? 1 : 0; }

  void record(const bool ok, const std::string& testName, const std::string& detail) {
    if (ok) {
      passed_++;
      printf("  \xE2\x9C\x93 PASS: %s\n", testName.c_str());
    } else {
      failed_++;
      if (detail.empty()) {
        printf("  \xE2\x9C\x97 FAIL: %s\n", testName.c_str());
      } else {
        printf("  \xE2\x9C\x97 FAIL: %s (%s)\n", testName.c_str(), detail.c_str());
      }
    }
  }

  std::string suiteName_;
  int passed_ = 0;
  int failed_ = 0;
  bool summarized_ = false;
};

}  // namespace TestUtils
