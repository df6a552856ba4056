#pragma once

#include <cstdint>
#include <string>

#include "../core/EventLoop.h"
#include "../core/Types.h"

namespace folio {

struct SaveReadingProgress {
  std::string bookId;
  std::string anchorString;
  uint8_t percentage = 0;
  uint32_t readTimeDeltaSeconds = 0;
};

// Where progress reports go (a sync service, a local store)
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;
  virtual void saveReadingProgress(const SaveReadingProgress& progress) = 0;
};

/**
 * Debounces page changes into progress reports. Only the last page of a
 * burst is reported; read time accumulates on the loop clock between reports.
 */
class ProgressReporter {
 public:
  static constexpr unsigned long DEFAULT_DEBOUNCE_MS = 300;

  ProgressReporter(EventLoop& loop, ProgressSink& sink, unsigned long debounceMs = DEFAULT_DEBOUNCE_MS);
  ~ProgressReporter();

  ProgressReporter(const ProgressReporter&) = delete;
  ProgressReporter& operator=(const ProgressReporter&) = delete;

  // Starts the read-time clock for a book and drops anything pending
  void start(const std::string& bookId);

  void pageSettled(const ReadingAnchor& anchor, uint32_t globalCharOffset, uint8_t percentage);

  // Report now if something is pending
  void flush();
  void cancel();

  bool hasPending() const { return hasPending_; }

 private:
  void send();

  EventLoop& loop_;
  ProgressSink& sink_;
  unsigned long debounceMs_;

  std::string bookId_;
  std::string anchorString_;
  uint8_t percentage_ = 0;
  bool hasPending_ = false;
  unsigned long lastReportAt_ = 0;
  EventLoop::TaskId timerId_ = EventLoop::INVALID_ID;
};

}  // namespace folio
