#include "ProgressReporter.h"

#include <Logging.h>

#include "AnchorCodec.h"

#define TAG "REPORT"

namespace folio {

ProgressReporter::ProgressReporter(EventLoop& loop, ProgressSink& sink, const unsigned long debounceMs)
    : loop_(loop), sink_(sink), debounceMs_(debounceMs) {}

ProgressReporter::~ProgressReporter() { cancel(); }

void ProgressReporter::start(const std::string& bookId) {
  cancel();
  bookId_ = bookId;
  lastReportAt_ = loop_.now();
}

void ProgressReporter::pageSettled(const ReadingAnchor& anchor, const uint32_t globalCharOffset,
                                   const uint8_t percentage) {
  if (bookId_.empty()) return;

  anchorString_ = serializeAnchor(anchor, globalCharOffset);
  percentage_ = percentage;
  hasPending_ = true;

  loop_.clearTimeout(timerId_);
  timerId_ = loop_.setTimeout(debounceMs_, [this] {
    timerId_ = EventLoop::INVALID_ID;
    send();
  });
}

void ProgressReporter::flush() {
  if (!hasPending_) return;
  loop_.clearTimeout(timerId_);
  timerId_ = EventLoop::INVALID_ID;
  send();
}

void ProgressReporter::cancel() {
  loop_.clearTimeout(timerId_);
  timerId_ = EventLoop::INVALID_ID;
  hasPending_ = false;
}

void ProgressReporter::send() {
  if (!hasPending_) return;
  hasPending_ = false;

  const unsigned long now = loop_.now();
  SaveReadingProgress progress;
  progress.bookId = bookId_;
  progress.anchorString = anchorString_;
  progress.percentage = percentage_;
  progress.readTimeDeltaSeconds = static_cast<uint32_t>((now - lastReportAt_) / 1000);
  lastReportAt_ = now;

  LOG_DBG(TAG, "Saving %s at %u%% (+%us)", progress.anchorString.c_str(), static_cast<unsigned>(progress.percentage),
          static_cast<unsigned>(progress.readTimeDeltaSeconds));
  sink_.saveReadingProgress(progress);
}

}  // namespace folio
