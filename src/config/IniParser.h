#pragma once

#include <cstdint>
#include <functional>

/**
 * Simple INI parser for reader configuration.
 *
 * Parses INI format:
 *   [section]
 *   key = value
 *   # comment
 *   ; comment
 */
class IniParser {
 public:
  /**
   * Callback for each key-value pair found.
   * @param section Current section name (empty if before first section)
   * @param key The key name
   * @param value The value (trimmed of whitespace)
   * @return true to continue parsing, false to stop
   */
  using Callback = std::function<bool(const char* section, const char* key, const char* value)>;

  /**
   * Parse an INI file.
   * @return true if the file was read, false if it cannot be opened
   */
  static bool parseFile(const char* path, Callback callback);

  /**
   * Parse an INI string in memory.
   */
  static bool parseString(const char* content, Callback callback);

  /**
   * Accepts: true/false, yes/no, 1/0, on/off
   */
  static bool parseBool(const char* value, bool defaultValue = false);

  static int parseInt(const char* value, int defaultValue = 0);

  static float parseFloat(const char* value, float defaultValue = 0.0f);

 private:
  static constexpr size_t MAX_LINE_LENGTH = 256;
  static constexpr size_t MAX_SECTION_LENGTH = 32;

  static void trimWhitespace(char* str);
  static bool parseLine(char* line, char* currentSection, const Callback& callback);
};
