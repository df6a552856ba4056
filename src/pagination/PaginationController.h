#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "../core/EventLoop.h"
#include "../core/Types.h"
#include "LayoutSettings.h"
#include "PaginationEngine.h"

namespace folio {

enum class PaginationChange : uint8_t {
  Blocking,  // typography, geometry or styles changed: every page number moved
  Silent,    // chapters loaded or evicted: estimates refined in the background
};

/**
 * Re-runs pagination when its inputs change. Triggers are debounced, then
 * deferred to the next frame, and the pass reads the inputs current at that
 * moment, so a burst of changes costs one pass.
 */
class PaginationController {
 public:
  using Listener = std::function<void(const PaginationResult& result, PaginationChange change)>;

  static constexpr unsigned long DEFAULT_DEBOUNCE_MS = 150;

  PaginationController(EventLoop& loop, PaginationEngine& engine, unsigned long debounceMs = DEFAULT_DEBOUNCE_MS);
  ~PaginationController();

  PaginationController(const PaginationController&) = delete;
  PaginationController& operator=(const PaginationController&) = delete;

  void setListener(Listener listener) { listener_ = std::move(listener); }

  // Snapshot identity is the change signal
  void setChapters(PaginationSnapshot chapters);
  void setStyles(const std::string& styles);
  void setLayoutSettings(const LayoutSettings& settings);

  const PaginationResult& result() const { return result_; }
  bool isReady() const { return result_.isReady; }
  bool isRepaginating() const { return repaginating_; }
  bool isScheduled() const { return timerId_ != EventLoop::INVALID_ID || frameId_ != EventLoop::INVALID_ID; }

  // Drop a scheduled pass
  void cancel();

 private:
  void schedule(bool blocking);
  void runPass();

  EventLoop& loop_;
  PaginationEngine& engine_;
  unsigned long debounceMs_;
  Listener listener_;

  PaginationSnapshot chapters_;
  std::string styles_;
  LayoutSettings settings_;
  std::string fingerprint_;
  bool hasSettings_ = false;
  bool hasRun_ = false;

  bool pendingBlocking_ = false;
  bool repaginating_ = false;
  EventLoop::TaskId timerId_ = EventLoop::INVALID_ID;
  EventLoop::TaskId frameId_ = EventLoop::INVALID_ID;

  PaginationResult result_;
};

}  // namespace folio
