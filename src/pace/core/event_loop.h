// Copyright (c) Maia

#pragma once

#include <cstddef>

#include "pace/core/scheduler.h"
#include "pace/core/timer_queue.h"

namespace pace::core {

/// \brief Single-threaded scheduler driven by the steady clock.
/// \details The owner drives the loop from one thread with RunUntilIdle() or
/// RunDue(). Only the loop itself waits for the next deadline; tasks never
/// block it.
class EventLoop : public IScheduler {
 public:
  [[nodiscard]] TimePoint Now() const override;

  TimerId ScheduleAfter(Duration delay, Task task) override;

  bool Cancel(TimerId id) override;

  /// \brief Runs every timer that is due now without waiting.
  /// \return Number of tasks executed.
  size_t RunDue();

  /// \brief Runs timers as they become due until none are left or Stop() is
  /// called from a task.
  /// \return Number of tasks executed.
  size_t RunUntilIdle();

  /// \brief Makes the running RunUntilIdle() or RunDue() return after the
  /// current task.
  void Stop();

  [[nodiscard]] size_t PendingCount() const {
    return timers_.Size();
  }

 private:
  size_t DrainDue();

  TimerQueue timers_;
  bool stop_requested_{false};
};

}  // namespace pace::core
