#include "IniParser.h"

#include <Logging.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <strings.h>

#define TAG "INI"

bool IniParser::parseFile(const char* path, Callback callback) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERR(TAG, "Failed to open %s", path);
    return false;
  }

  char section[MAX_SECTION_LENGTH] = "";
  char line[MAX_LINE_LENGTH];
  std::string raw;
  while (std::getline(file, raw)) {
    strncpy(line, raw.c_str(), sizeof(line) - 1);
    line[sizeof(line) - 1] = '\0';
    if (!parseLine(line, section, callback)) {
      break;
    }
  }
  return true;
}

bool IniParser::parseString(const char* content, Callback callback) {
  if (!content) return false;

  char section[MAX_SECTION_LENGTH] = "";
  char line[MAX_LINE_LENGTH];
  const char* p = content;

  while (*p) {
    const char* end = strchr(p, '\n');
    size_t len = end ? static_cast<size_t>(end - p) : strlen(p);
    if (len >= sizeof(line)) len = sizeof(line) - 1;
    memcpy(line, p, len);
    line[len] = '\0';

    if (!parseLine(line, section, callback)) {
      break;
    }
    if (!end) break;
    p = end + 1;
  }
  return true;
}

void IniParser::trimWhitespace(char* str) {
  char* start = str;
  while (*start && isspace(static_cast<unsigned char>(*start))) start++;

  char* end = start + strlen(start);
  while (end > start && isspace(static_cast<unsigned char>(end[-1]))) end--;
  *end = '\0';

  if (start != str) {
    memmove(str, start, static_cast<size_t>(end - start) + 1);
  }
}

bool IniParser::parseLine(char* line, char* currentSection, const Callback& callback) {
  trimWhitespace(line);

  // Empty line or comment
  if (line[0] == '\0' || line[0] == '#' || line[0] == ';') {
    return true;
  }

  if (line[0] == '[') {
    char* close = strchr(line, ']');
    if (!close) {
      LOG_DBG(TAG, "Unterminated section header: %s", line);
      return true;
    }
    *close = '\0';
    strncpy(currentSection, line + 1, MAX_SECTION_LENGTH - 1);
    currentSection[MAX_SECTION_LENGTH - 1] = '\0';
    trimWhitespace(currentSection);
    return true;
  }

  char* eq = strchr(line, '=');
  if (!eq) {
    LOG_DBG(TAG, "Ignoring line without '=': %s", line);
    return true;
  }
  *eq = '\0';
  char* key = line;
  char* value = eq + 1;
  trimWhitespace(key);
  trimWhitespace(value);
  if (key[0] == '\0') {
    return true;
  }

  return callback(currentSection, key, value);
}

bool IniParser::parseBool(const char* value, const bool defaultValue) {
  if (!value || !*value) return defaultValue;
  if (strcasecmp(value, "true") == 0 || strcasecmp(value, "yes") == 0 || strcmp(value, "1") == 0 ||
      strcasecmp(value, "on") == 0) {
    return true;
  }
  if (strcasecmp(value, "false") == 0 || strcasecmp(value, "no") == 0 || strcmp(value, "0") == 0 ||
      strcasecmp(value, "off") == 0) {
    return false;
  }
  return defaultValue;
}

int IniParser::parseInt(const char* value, const int defaultValue) {
  if (!value || !*value) return defaultValue;
  char* end = nullptr;
  errno = 0;
  const long result = strtol(value, &end, 10);
  if (end == value || *end != '\0' || errno == ERANGE) return defaultValue;
  return static_cast<int>(result);
}

float IniParser::parseFloat(const char* value, const float defaultValue) {
  if (!value || !*value) return defaultValue;
  char* end = nullptr;
  errno = 0;
  const float result = strtof(value, &end);
  if (end == value || *end != '\0' || errno == ERANGE) return defaultValue;
  return result;
}
