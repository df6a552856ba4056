#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace folio {

/**
 * Single-threaded cooperative scheduler: posted tasks, timers and
 * frame callbacks. Every callback runs to completion before the next.
 * The host drives it (tick() from its main loop); tests drive it with
 * a manual clock.
 */
class EventLoop {
 public:
  using Task = std::function<void()>;
  using Clock = std::function<unsigned long()>;
  using TaskId = uint32_t;

  static constexpr TaskId INVALID_ID = 0;

  // Defaults to millis()
  explicit EventLoop(Clock clock = nullptr);

  unsigned long now() const { return clock_(); }

  void post(Task task);

  TaskId setTimeout(unsigned long delayMs, Task task);
  void clearTimeout(TaskId id);

  // Runs on the next frame, after everything already queued
  TaskId requestFrame(Task task);
  void cancelFrame(TaskId id);

  // Run posted tasks until the queue is empty
  size_t runPending();
  // Run timers that are due now, earliest first
  size_t runTimers();
  // Run the frame callbacks requested before this call
  size_t runFrame();

  // One turn: posted tasks, due timers, one frame
  size_t tick();

  // Turn until nothing is ready at the current time. Does not advance the clock.
  size_t runUntilIdle(size_t maxTurns = 1000);

  bool hasReadyWork() const;
  size_t pendingTimers() const { return timers_.size(); }
  size_t pendingFrames() const { return frames_.size(); }

  // Drop everything scheduled
  void clear();

 private:
  struct Timer {
    unsigned long due;
    Task task;
  };

  Clock clock_;
  TaskId nextId_ = 1;
  std::deque<Task> posted_;
  std::map<TaskId, Timer> timers_;
  std::vector<std::pair<TaskId, Task>> frames_;
};

}  // namespace folio
