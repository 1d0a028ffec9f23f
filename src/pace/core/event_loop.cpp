// Copyright (c) Maia

#include "pace/core/event_loop.h"

#include <algorithm>
#include <thread>

#include "pace/logging.h"

namespace pace::core {

EventLoop::TimePoint EventLoop::Now() const {
  return Clock::now();
}

TimerId EventLoop::ScheduleAfter(Duration delay, Task task) {
  return timers_.Add(Now() + std::max(delay, Duration::zero()),
                     std::move(task));
}

bool EventLoop::Cancel(TimerId id) {
  return timers_.Cancel(id);
}

size_t EventLoop::RunDue() {
  stop_requested_ = false;
  return DrainDue();
}

size_t EventLoop::DrainDue() {
  const auto now = Now();
  size_t executed = 0;
  while (!stop_requested_) {
    auto task = timers_.PopDue(now);
    if (!task) {
      break;
    }
    (*task)();
    ++executed;
  }
  return executed;
}

size_t EventLoop::RunUntilIdle() {
  stop_requested_ = false;
  size_t executed = 0;
  while (!stop_requested_) {
    auto deadline = timers_.NextDeadline();
    if (!deadline) {
      break;
    }
    if (*deadline > Now()) {
      std::this_thread::sleep_until(*deadline);
    }
    executed += DrainDue();
  }
  LogTrace("Event loop idle after {} tasks, {} pending.",
           executed,
           timers_.Size());
  return executed;
}

void EventLoop::Stop() {
  stop_requested_ = true;
}

}  // namespace pace::core
