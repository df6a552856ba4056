#pragma once

#include <cstdarg>
#include <cstdio>

// 0 = errors only, 1 = info, 2 = debug
#ifndef LOG_LEVEL
#define LOG_LEVEL 1
#endif

/**
 * Milliseconds since the first call (process uptime on host builds).
 */
unsigned long millis();

using LogSink = void (*)(const char* line);
using LogClock = unsigned long (*)();

// Replace the output sink. nullptr disables all output.
void logSetSink(LogSink sink);
// Restore the default sink (stderr).
void logResetSink();
// Replace the timestamp source. nullptr restores millis().
void logSetClock(LogClock clock);

void logPrintf(const char* level, const char* origin, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

#define LOG_ERR(origin, format, ...) logPrintf("[ERR]", origin, format "\n", ##__VA_ARGS__)

#if LOG_LEVEL >= 1
#define LOG_INF(origin, format, ...) logPrintf("[INF]", origin, format "\n", ##__VA_ARGS__)
#else
#define LOG_INF(origin, format, ...) \
  do {                               \
  } while (0)
#endif

#if LOG_LEVEL >= 2
#define LOG_DBG(origin, format, ...) logPrintf("[DBG]", origin, format "\n", ##__VA_ARGS__)
#else
#define LOG_DBG(origin, format, ...) \
  do {                               \
  } while (0)
#endif
