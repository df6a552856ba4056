#include "CssParser.h"

#include <Logging.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

#define TAG "CSS"

namespace {

std::string trim(const std::string& str) {
  size_t start = 0;
  while (start < str.size() && std::isspace(static_cast<unsigned char>(str[start]))) {
    ++start;
  }
  if (start == str.size()) return "";

  size_t end = str.size() - 1;
  while (end > start && std::isspace(static_cast<unsigned char>(str[end]))) {
    --end;
  }
  return str.substr(start, end - start + 1);
}

std::string toLower(const std::string& str) {
  std::string result = str;
  for (char& c : result) {
    if (c >= 'A' && c <= 'Z') {
      c = c - 'A' + 'a';
    }
  }
  return result;
}

bool endsWith(const std::string& s, const char* suffix, size_t suffixLen) {
  return s.size() >= suffixLen && s.compare(s.size() - suffixLen, suffixLen, suffix) == 0;
}

// Drop a trailing "!important"
std::string stripImportant(const std::string& value) {
  const size_t bang = value.find('!');
  return bang == std::string::npos ? value : trim(value.substr(0, bang));
}

std::vector<std::string> splitWhitespace(const std::string& value) {
  std::vector<std::string> parts;
  std::istringstream iss(value);
  std::string part;
  while (iss >> part) {
    parts.push_back(part);
  }
  return parts;
}

}  // namespace

void CssParser::parseString(const std::string& css) {
  std::string selector;
  std::string properties;
  bool inComment = false;
  bool inAtRule = false;
  bool inRule = false;
  bool inString = false;
  char stringQuote = 0;
  int braceCount = 0;

  for (size_t i = 0; i < css.size(); i++) {
    const char c = css[i];

    // Handle comment start '/*'
    if (!inComment && !inString && c == '/' && i + 1 < css.size() && css[i + 1] == '*') {
      inComment = true;
      i++;
      continue;
    }

    if (inComment) {
      if (c == '*' && i + 1 < css.size() && css[i + 1] == '/') {
        inComment = false;
        i++;
      }
      continue;
    }

    // Ignore carriage returns
    if (c == '\r') continue;

    if (!inRule) {
      // Handle AT-rules (@media, @font-face, @import ...): skipped with their blocks
      if (inAtRule) {
        if (c == '{') {
          braceCount++;
        } else if (c == '}') {
          if (braceCount > 0) {
            braceCount--;
            if (braceCount == 0) {
              inAtRule = false;
            }
          }
        } else if (c == ';' && braceCount == 0) {
          inAtRule = false;
        }
        continue;
      }

      if (c == '@') {
        inAtRule = true;
        braceCount = 0;
        continue;
      }

      if (c == '{') {
        inRule = true;
        braceCount = 1;
        selector = trim(selector);
        properties.clear();
        continue;
      }

      if (selector.size() < MAX_CSS_SELECTOR_LENGTH) {
        selector += c;
      }
    } else {
      // Inside declaration block
      if (!inString && (c == '"' || c == '\'')) {
        inString = true;
        stringQuote = c;
        properties += c;
        continue;
      } else if (inString && c == stringQuote) {
        inString = false;
        stringQuote = 0;
        properties += c;
        continue;
      }

      if (!inString) {
        if (c == '{') {
          braceCount++;
        } else if (c == '}') {
          braceCount--;
          if (braceCount == 0) {
            properties = trim(properties);
            if (!selector.empty() && !properties.empty()) {
              parseRule(selector, properties);
            }
            selector.clear();
            properties.clear();
            inRule = false;
            continue;
          }
        }
      }

      properties += c;
    }
  }

  // Handle incomplete rule at EOF
  if (inRule && !properties.empty()) {
    properties = trim(properties);
    selector = trim(selector);
    if (!selector.empty()) {
      parseRule(selector, properties);
    }
  }

  LOG_DBG(TAG, "Loaded %d style rules", static_cast<int>(styleMap_.size()));
}

bool CssParser::parseFile(const char* filepath) {
  std::ifstream file(filepath, std::ios::binary);
  if (!file) {
    LOG_ERR(TAG, "Failed to open %s", filepath);
    return false;
  }
  std::ostringstream content;
  content << file.rdbuf();
  parseString(content.str());
  return true;
}

const CssStyle* CssParser::getStyleForClass(const std::string& className) const {
  auto it = styleMap_.find(className);
  if (it != styleMap_.end()) {
    return &it->second;
  }
  return nullptr;
}

CssStyle CssParser::getCombinedStyle(const std::string& tagName, const std::string& classNames) const {
  CssStyle combined;

  // First apply tag-level styles
  const CssStyle* tagStyle = getStyleForClass(tagName);
  if (tagStyle) {
    combined.merge(*tagStyle);
  }

  // Split class names by whitespace and apply each
  size_t start = 0;
  const size_t len = classNames.length();

  while (start < len) {
    while (start < len && std::isspace(static_cast<unsigned char>(classNames[start]))) {
      ++start;
    }
    if (start >= len) break;

    size_t end = start;
    while (end < len && !std::isspace(static_cast<unsigned char>(classNames[end]))) {
      ++end;
    }

    const std::string className = classNames.substr(start, end - start);

    const CssStyle* classOnly = getStyleForClass("." + className);
    if (classOnly) {
      combined.merge(*classOnly);
    }

    const CssStyle* tagAndClass = getStyleForClass(tagName + "." + className);
    if (tagAndClass) {
      combined.merge(*tagAndClass);
    }

    start = end;
  }

  return combined;
}

void CssParser::parseRule(const std::string& selector, const std::string& properties) {
  CssStyle style;
  parseDeclarations(properties, style);
  if (!style.hasAny()) {
    return;
  }

  // Handle comma-separated selectors
  size_t start = 0;
  const size_t len = selector.length();

  while (start < len) {
    size_t end = selector.find(',', start);
    if (end == std::string::npos) end = len;

    const std::string singleSelector = trim(selector.substr(start, end - start));

    if (!singleSelector.empty()) {
      auto it = styleMap_.find(singleSelector);
      if (it != styleMap_.end()) {
        it->second.merge(style);
      } else if (styleMap_.size() < MAX_CSS_RULES) {
        styleMap_[singleSelector] = style;
      } else {
        LOG_DBG(TAG, "Rule limit reached, dropping %s", singleSelector.c_str());
      }
    }

    start = end + 1;
  }
}

void CssParser::parseDeclarations(const std::string& properties, CssStyle& style) {
  size_t propStart = 0;
  const size_t propLen = properties.length();

  while (propStart < propLen) {
    size_t propEnd = properties.find(';', propStart);
    if (propEnd == std::string::npos) propEnd = propLen;

    const std::string prop = trim(properties.substr(propStart, propEnd - propStart));

    if (!prop.empty()) {
      const size_t colonPos = prop.find(':');
      if (colonPos != std::string::npos && colonPos > 0) {
        const std::string propName = toLower(trim(prop.substr(0, colonPos)));
        const std::string propValue = stripImportant(toLower(trim(prop.substr(colonPos + 1))));
        parseProperty(propName, propValue, style);
      }
    }

    propStart = propEnd + 1;
  }
}

void CssParser::parseProperty(const std::string& name, const std::string& value, CssStyle& style) {
  if (name == "font-style") {
    style.fontStyle = parseFontStyle(value);
    style.hasFontStyle = true;
  } else if (name == "font-weight") {
    style.fontWeight = parseFontWeight(value);
    style.hasFontWeight = true;
  } else if (name == "font-size") {
    style.hasFontSize = parseFontSize(value, style.fontSize);
  } else if (name == "text-indent") {
    style.hasTextIndent = parseLength(value, style.textIndent);
  } else if (name == "margin-top") {
    style.hasMarginTop = parseLength(value, style.marginTop);
  } else if (name == "margin-bottom") {
    style.hasMarginBottom = parseLength(value, style.marginBottom);
  } else if (name == "margin") {
    parseMarginShorthand(value, style);
  } else if (name == "display") {
    if (value == "none") {
      style.display = CssDisplay::None;
    } else if (value == "inline" || value == "inline-block") {
      style.display = CssDisplay::Inline;
    } else {
      style.display = CssDisplay::Block;
    }
    style.hasDisplay = true;
  }
}

CssFontStyle CssParser::parseFontStyle(const std::string& value) {
  if (value == "italic" || value == "oblique") {
    return CssFontStyle::Italic;
  }
  return CssFontStyle::Normal;
}

CssFontWeight CssParser::parseFontWeight(const std::string& value) {
  if (value == "bold" || value == "bolder" || value == "600" || value == "700" || value == "800" || value == "900") {
    return CssFontWeight::Bold;
  }
  return CssFontWeight::Normal;
}

bool CssParser::parseLength(const std::string& value, CssLength& out) {
  std::string v = trim(value);
  if (v.empty()) {
    return false;
  }
  if (v == "auto") {
    out = CssLength(0.0f, CssUnit::Px);
    return true;
  }

  CssUnit unit = CssUnit::Px;
  float factor = 1.0f;
  if (endsWith(v, "rem", 3)) {
    unit = CssUnit::Rem;
    v.resize(v.size() - 3);
  } else if (endsWith(v, "em", 2)) {
    unit = CssUnit::Em;
    v.resize(v.size() - 2);
  } else if (endsWith(v, "px", 2)) {
    v.resize(v.size() - 2);
  } else if (endsWith(v, "pt", 2)) {
    factor = 4.0f / 3.0f;
    v.resize(v.size() - 2);
  } else if (endsWith(v, "%", 1)) {
    unit = CssUnit::Percent;
    v.resize(v.size() - 1);
  }

  v = trim(v);
  if (v.empty()) {
    return false;
  }
  char* end = nullptr;
  const float number = std::strtof(v.c_str(), &end);
  if (end == v.c_str() || *end != '\0') {
    return false;
  }
  // A unitless number is only valid for zero
  if (unit == CssUnit::Px && factor == 1.0f && number != 0.0f && !endsWith(trim(value), "px", 2)) {
    return false;
  }
  out = CssLength(number * factor, unit);
  return true;
}

bool CssParser::parseFontSize(const std::string& value, CssLength& out) {
  static const struct {
    const char* keyword;
    float em;
  } keywords[] = {{"xx-small", 0.6f}, {"x-small", 0.75f}, {"small", 0.89f}, {"medium", 1.0f},   {"large", 1.2f},
                  {"x-large", 1.5f},  {"xx-large", 2.0f}, {"smaller", 0.83f}, {"larger", 1.2f}};
  for (const auto& kw : keywords) {
    if (value == kw.keyword) {
      // Absolute keywords are relative to the root size, relative ones to the parent
      const bool relative = value == "smaller" || value == "larger";
      out = CssLength(kw.em, relative ? CssUnit::Em : CssUnit::Rem);
      return true;
    }
  }
  return parseLength(value, out);
}

void CssParser::parseMarginShorthand(const std::string& value, CssStyle& style) {
  const std::vector<std::string> parts = splitWhitespace(value);
  if (parts.empty() || parts.size() > 4) {
    return;
  }
  // 1 or 2 values: vertical = first; 3 or 4 values: top = first, bottom = third
  const std::string& top = parts[0];
  const std::string& bottom = parts.size() >= 3 ? parts[2] : parts[0];
  style.hasMarginTop = parseLength(top, style.marginTop);
  style.hasMarginBottom = parseLength(bottom, style.marginBottom);
}

CssStyle CssParser::parseInlineStyle(const std::string& styleAttr) {
  CssStyle style;
  if (!styleAttr.empty()) {
    parseDeclarations(styleAttr, style);
  }
  return style;
}
