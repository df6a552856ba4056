#include "LayoutSettings.h"

#include <cstdio>

namespace folio {

std::string LayoutSettings::fingerprint() const {
  char buf[160];
  snprintf(buf, sizeof(buf), "%g_%g_%s_%u_%u", static_cast<double>(typography.fontSize),
           static_cast<double>(typography.lineHeight), typography.fontFamily.c_str(),
           static_cast<unsigned>(contentWidth()), static_cast<unsigned>(contentHeight()));
  return buf;
}

}  // namespace folio
