#include "Logging.h"

#include <chrono>

namespace {

void stderrSink(const char* line) {
  fputs(line, stderr);
  fflush(stderr);
}

LogSink currentSink = stderrSink;
LogClock currentClock = nullptr;

}  // namespace

unsigned long millis() {
  static const auto start = std::chrono::steady_clock::now();
  const auto elapsed = std::chrono::steady_clock::now() - start;
  return static_cast<unsigned long>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

void logSetSink(LogSink sink) { currentSink = sink; }

void logResetSink() { currentSink = stderrSink; }

void logSetClock(LogClock clock) { currentClock = clock; }

void logPrintf(const char* level, const char* origin, const char* format, ...) {
  if (!currentSink) {
    return;
  }
  va_list args;
  va_start(args, format);
  char buf[256];
  char* c = buf;
  const char* const end = buf + sizeof(buf);

  const unsigned long now = currentClock ? currentClock() : millis();
  int len = snprintf(c, end - c, "[%lu] ", now);
  if (len > 0) c += (len < end - c) ? len : end - c - 1;

  const char* p = level;
  while (*p && c < end - 1) *c++ = *p++;
  if (c < end - 1) *c++ = ' ';
  *c = '\0';

  len = snprintf(c, end - c, "[%s] ", origin);
  if (len > 0) c += (len < end - c) ? len : end - c - 1;

  vsnprintf(c, end - c, format, args);
  va_end(args);
  currentSink(buf);
}
