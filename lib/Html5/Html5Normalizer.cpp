#include "Html5Normalizer.h"

#include <cctype>
#include <cstring>

namespace html5 {

namespace {

// HTML5 void elements that cannot have closing tags (lowercase for case-insensitive matching)
constexpr const char* VOID_ELEMENTS[] = {"img",  "br",  "hr",    "input", "meta",   "link",  "area",
                                         "base", "col", "embed", "param", "source", "track", "wbr"};
constexpr size_t VOID_ELEMENT_COUNT = sizeof(VOID_ELEMENTS) / sizeof(VOID_ELEMENTS[0]);
constexpr size_t MAX_TAG_NAME_LENGTH = 8;
constexpr size_t MAX_ENTITY_NAME_LENGTH = 32;

enum class State { Normal, InTagStart, InTagName, InTagAttrs, InQuote, InClosingTagName, InClosingTagRest };

char toLowerAscii(char c) { return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c; }

bool isVoidElement(const char* name, size_t len) {
  for (size_t i = 0; i < VOID_ELEMENT_COUNT; i++) {
    const char* ve = VOID_ELEMENTS[i];
    const size_t veLen = strlen(ve);
    if (len == veLen) {
      bool match = true;
      for (size_t j = 0; j < len && match; j++) {
        if (toLowerAscii(name[j]) != ve[j]) match = false;
      }
      if (match) return true;
    }
  }
  return false;
}

bool startsWithNoCase(const std::string& s, size_t pos, const char* prefix) {
  const size_t n = strlen(prefix);
  if (pos + n > s.size()) return false;
  for (size_t i = 0; i < n; i++) {
    if (toLowerAscii(s[pos + i]) != toLowerAscii(prefix[i])) return false;
  }
  return true;
}

size_t skipWhitespace(const std::string& s, size_t pos) {
  while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) pos++;
  return pos;
}

// True if s[pos] == '&' begins "&name;", "&#123;" or "&#x1F;"
bool isReference(const std::string& s, size_t pos) {
  size_t i = pos + 1;
  if (i < s.size() && s[i] == '#') {
    i++;
    const bool hex = i < s.size() && (s[i] == 'x' || s[i] == 'X');
    if (hex) i++;
    const size_t digitsStart = i;
    while (i < s.size() && (hex ? std::isxdigit(static_cast<unsigned char>(s[i]))
                                : std::isdigit(static_cast<unsigned char>(s[i])))) {
      i++;
    }
    return i > digitsStart && i < s.size() && s[i] == ';';
  }
  const size_t nameStart = i;
  while (i < s.size() && i - nameStart <= MAX_ENTITY_NAME_LENGTH && std::isalnum(static_cast<unsigned char>(s[i]))) {
    i++;
  }
  return i > nameStart && i < s.size() && s[i] == ';';
}

}  // namespace

std::string normalizeVoidElements(const std::string& html) {
  std::string out;
  out.reserve(html.size() + html.size() / 32);

  State state = State::Normal;
  char tagName[MAX_TAG_NAME_LENGTH + 1] = {0};
  size_t tagNameLen = 0;
  char closingTagWhitespace[8] = {0};  // Buffer for whitespace in closing tags
  size_t closingTagWsLen = 0;
  bool isCurrentTagVoid = false;
  char quoteChar = 0;
  char prevChar = 0;

  auto writeClosingPrefix = [&]() {
    out += "</";
    out.append(tagName, tagNameLen);
  };

  for (const char c : html) {
    switch (state) {
      case State::Normal:
        if (c == '<') {
          state = State::InTagStart;
          tagNameLen = 0;
          isCurrentTagVoid = false;
          // Don't write '<' yet - might need to skip if it's a void element closing tag
        } else {
          out += c;
        }
        break;

      case State::InTagStart:
        if (c == '/') {
          state = State::InClosingTagName;
          tagNameLen = 0;
          closingTagWsLen = 0;
        } else if (c == '!' || c == '?') {
          // Comment or processing instruction - skip normalization
          state = State::Normal;
          out += '<';
          out += c;
        } else if (std::isalpha(static_cast<unsigned char>(c))) {
          state = State::InTagName;
          tagName[0] = c;
          tagNameLen = 1;
          out += '<';
          out += c;
        } else {
          state = State::Normal;
          out += "&lt;";
          out += c;
        }
        break;

      case State::InTagName:
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == ':') {
          if (tagNameLen < MAX_TAG_NAME_LENGTH) {
            tagName[tagNameLen++] = c;
          } else {
            tagNameLen = MAX_TAG_NAME_LENGTH + 1;  // too long to be a void element
          }
          out += c;
        } else {
          isCurrentTagVoid = tagNameLen <= MAX_TAG_NAME_LENGTH && isVoidElement(tagName, tagNameLen);

          if (c == '>') {
            if (isCurrentTagVoid && prevChar != '/') {
              out += " /";
            }
            out += c;
            state = State::Normal;
          } else if (std::isspace(static_cast<unsigned char>(c)) || c == '/') {
            out += c;
            state = State::InTagAttrs;
          } else {
            out += c;
            state = State::Normal;
          }
        }
        break;

      case State::InTagAttrs:
        if (c == '"' || c == '\'') {
          state = State::InQuote;
          quoteChar = c;
          out += c;
        } else if (c == '>') {
          if (isCurrentTagVoid && prevChar != '/') {
            out += " /";
          }
          out += c;
          state = State::Normal;
        } else {
          out += c;
        }
        break;

      case State::InQuote:
        if (c == quoteChar) {
          state = State::InTagAttrs;
        }
        out += c;
        break;

      case State::InClosingTagName:
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == ':') {
          if (tagNameLen < MAX_TAG_NAME_LENGTH) {
            tagName[tagNameLen++] = c;
          } else {
            // Tag too long to be void - flush buffer and passthrough
            writeClosingPrefix();
            out += c;
            state = State::InClosingTagRest;
          }
        } else if (c == '>') {
          // Closing tags of void elements are dropped entirely
          if (!isVoidElement(tagName, tagNameLen)) {
            writeClosingPrefix();
            out.append(closingTagWhitespace, closingTagWsLen);
            out += '>';
          }
          state = State::Normal;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
          if (closingTagWsLen < sizeof(closingTagWhitespace)) {
            closingTagWhitespace[closingTagWsLen++] = c;
          }
        } else {
          writeClosingPrefix();
          out += c;
          state = State::Normal;
        }
        break;

      case State::InClosingTagRest:
        out += c;
        if (c == '>') {
          state = State::Normal;
        }
        break;
    }

    prevChar = c;
  }

  // Flush any buffered but uncommitted content
  if (state == State::InTagStart) {
    out += "&lt;";
  } else if (state == State::InClosingTagName) {
    writeClosingPrefix();
    out.append(closingTagWhitespace, closingTagWsLen);
  }

  return out;
}

std::string escapeStrayAmpersands(const std::string& html) {
  std::string out;
  out.reserve(html.size());
  // Attribute values and text both need escaping; tag names never contain '&'
  for (size_t i = 0; i < html.size(); i++) {
    if (html[i] == '&' && !isReference(html, i)) {
      out += "&amp;";
    } else {
      out += html[i];
    }
  }
  return out;
}

std::string stripPrologue(const std::string& html) {
  size_t pos = skipWhitespace(html, 0);
  // Skip a UTF-8 BOM
  if (html.compare(pos, 3, "\xEF\xBB\xBF") == 0) {
    pos = skipWhitespace(html, pos + 3);
  }

  bool progressed = true;
  while (progressed) {
    progressed = false;
    if (startsWithNoCase(html, pos, "<?xml")) {
      const size_t end = html.find("?>", pos);
      if (end == std::string::npos) break;
      pos = skipWhitespace(html, end + 2);
      progressed = true;
    } else if (startsWithNoCase(html, pos, "<!doctype")) {
      const size_t end = html.find('>', pos);
      if (end == std::string::npos) break;
      pos = skipWhitespace(html, end + 1);
      progressed = true;
    }
  }
  return html.substr(pos);
}

std::string toXmlFragment(const std::string& html, const char* rootTag) {
  std::string body = escapeStrayAmpersands(normalizeVoidElements(stripPrologue(html)));
  std::string out;
  out.reserve(body.size() + 2 * strlen(rootTag) + 5);
  out += '<';
  out += rootTag;
  out += '>';
  out += body;
  out += "</";
  out += rootTag;
  out += '>';
  return out;
}

}  // namespace html5
