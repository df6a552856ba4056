#pragma once
#include <string>

namespace html5 {

// Normalize HTML5 void elements to XHTML self-closing format
// Converts <img src="x"> to <img src="x" /> and drops stray </br> style closing tags
std::string normalizeVoidElements(const std::string& html);

// Escape '&' that does not start a character or entity reference ("AT&T" -> "AT&amp;T")
std::string escapeStrayAmpersands(const std::string& html);

// Remove a leading XML declaration and DOCTYPE, if present
std::string stripPrologue(const std::string& html);

// Turn an HTML body fragment into a well-formed XML document under a synthetic root element
std::string toXmlFragment(const std::string& html, const char* rootTag);

}  // namespace html5
