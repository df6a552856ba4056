#include "EventLoop.h"

#include <Logging.h>

#define TAG "LOOP"

namespace folio {

EventLoop::EventLoop(Clock clock) : clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return millis(); };
  }
}

void EventLoop::post(Task task) {
  if (task) posted_.push_back(std::move(task));
}

EventLoop::TaskId EventLoop::setTimeout(const unsigned long delayMs, Task task) {
  if (!task) return INVALID_ID;
  const TaskId id = nextId_++;
  timers_[id] = Timer{now() + delayMs, std::move(task)};
  return id;
}

void EventLoop::clearTimeout(const TaskId id) { timers_.erase(id); }

EventLoop::TaskId EventLoop::requestFrame(Task task) {
  if (!task) return INVALID_ID;
  const TaskId id = nextId_++;
  frames_.emplace_back(id, std::move(task));
  return id;
}

void EventLoop::cancelFrame(const TaskId id) {
  for (auto it = frames_.begin(); it != frames_.end(); ++it) {
    if (it->first == id) {
      frames_.erase(it);
      return;
    }
  }
}

size_t EventLoop::runPending() {
  size_t ran = 0;
  while (!posted_.empty()) {
    Task task = std::move(posted_.front());
    posted_.pop_front();
    task();
    ran++;
  }
  return ran;
}

size_t EventLoop::runTimers() {
  size_t ran = 0;
  while (true) {
    const unsigned long t = now();
    auto next = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      // Ids grow monotonically, so the first minimum is the earliest scheduled
      if (it->second.due <= t && (next == timers_.end() || it->second.due < next->second.due)) {
        next = it;
      }
    }
    if (next == timers_.end()) break;

    Task task = std::move(next->second.task);
    timers_.erase(next);
    task();
    ran++;
  }
  return ran;
}

size_t EventLoop::runFrame() {
  if (frames_.empty()) return 0;

  // Callbacks requested during this frame wait for the next one
  std::vector<std::pair<TaskId, Task>> frame;
  frame.swap(frames_);
  for (auto& entry : frame) {
    entry.second();
  }
  return frame.size();
}

size_t EventLoop::tick() {
  size_t ran = runPending();
  ran += runTimers();
  ran += runFrame();
  ran += runPending();
  return ran;
}

bool EventLoop::hasReadyWork() const {
  if (!posted_.empty() || !frames_.empty()) return true;
  const unsigned long t = now();
  for (const auto& entry : timers_) {
    if (entry.second.due <= t) return true;
  }
  return false;
}

size_t EventLoop::runUntilIdle(const size_t maxTurns) {
  size_t ran = 0;
  size_t turns = 0;
  while (hasReadyWork()) {
    if (turns++ >= maxTurns) {
      LOG_ERR(TAG, "Still busy after %d turns, giving up", static_cast<int>(maxTurns));
      break;
    }
    ran += tick();
  }
  return ran;
}

void EventLoop::clear() {
  posted_.clear();
  timers_.clear();
  frames_.clear();
}

}  // namespace folio
