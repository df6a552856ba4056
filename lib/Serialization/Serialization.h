#pragma once

#include <cstdint>
#include <iostream>
#include <string>

namespace serialization {

template <typename T>
static void writePod(std::ostream& os, const T& value) {
  os.write(reinterpret_cast<const char*>(&value), sizeof(T));
}

template <typename T>
static void readPod(std::istream& is, T& value) {
  is.read(reinterpret_cast<char*>(&value), sizeof(T));
}

template <typename T>
[[nodiscard]] static bool readPodChecked(std::istream& is, T& value) {
  is.read(reinterpret_cast<char*>(&value), sizeof(T));
  return is.good();
}

static void writeString(std::ostream& os, const std::string& s) {
  const uint32_t len = s.size();
  writePod(os, len);
  os.write(s.data(), len);
}

// Strings longer than maxLen are treated as corruption.
[[nodiscard]] static bool readString(std::istream& is, std::string& s, uint32_t maxLen = 65536) {
  uint32_t len;
  readPod(is, len);
  if (!is.good()) {
    s.clear();
    return false;
  }
  if (len > maxLen) {
    s.clear();
    is.setstate(std::ios::failbit);
    return false;
  }
  s.resize(len);
  if (len > 0) {
    is.read(&s[0], len);
  }
  return is.good();
}

}  // namespace serialization
