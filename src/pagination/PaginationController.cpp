#include "PaginationController.h"

#include <Logging.h>

#define TAG "PCTRL"

namespace folio {

PaginationController::PaginationController(EventLoop& loop, PaginationEngine& engine, const unsigned long debounceMs)
    : loop_(loop), engine_(engine), debounceMs_(debounceMs) {}

PaginationController::~PaginationController() { cancel(); }

void PaginationController::setChapters(PaginationSnapshot chapters) {
  if (chapters == chapters_) return;
  chapters_ = std::move(chapters);
  schedule(false);
}

void PaginationController::setStyles(const std::string& styles) {
  if (styles == styles_) return;
  styles_ = styles;
  schedule(true);
}

void PaginationController::setLayoutSettings(const LayoutSettings& settings) {
  const std::string fingerprint = settings.fingerprint();
  if (hasSettings_ && fingerprint == fingerprint_) return;
  settings_ = settings;
  fingerprint_ = fingerprint;
  hasSettings_ = true;
  schedule(true);
}

void PaginationController::schedule(const bool blocking) {
  // The first pass always blocks
  if (blocking || !hasRun_) {
    pendingBlocking_ = true;
    repaginating_ = true;
  }

  // Already waiting for the frame: the pass will see the new inputs
  if (frameId_ != EventLoop::INVALID_ID) return;

  if (timerId_ != EventLoop::INVALID_ID) {
    loop_.clearTimeout(timerId_);
  }
  timerId_ = loop_.setTimeout(debounceMs_, [this] {
    timerId_ = EventLoop::INVALID_ID;
    frameId_ = loop_.requestFrame([this] {
      frameId_ = EventLoop::INVALID_ID;
      runPass();
    });
  });
}

void PaginationController::cancel() {
  if (timerId_ != EventLoop::INVALID_ID) {
    loop_.clearTimeout(timerId_);
    timerId_ = EventLoop::INVALID_ID;
  }
  if (frameId_ != EventLoop::INVALID_ID) {
    loop_.cancelFrame(frameId_);
    frameId_ = EventLoop::INVALID_ID;
  }
  pendingBlocking_ = false;
  repaginating_ = false;
}

void PaginationController::runPass() {
  const PaginationChange change = pendingBlocking_ ? PaginationChange::Blocking : PaginationChange::Silent;
  pendingBlocking_ = false;

  static const std::vector<PaginationChapter> noChapters;
  const std::vector<PaginationChapter>& chapters = chapters_ ? *chapters_ : noChapters;

  // Hold the snapshot for the whole pass
  const PaginationSnapshot held = chapters_;
  result_ = engine_.paginate(chapters, styles_, settings_);
  hasRun_ = true;
  repaginating_ = false;

  LOG_DBG(TAG, "%s pass: %u pages", change == PaginationChange::Blocking ? "Blocking" : "Silent",
          result_.totalPages);
  if (listener_) {
    listener_(result_, change);
  }
}

}  // namespace folio
