// Copyright (c) Maia

#pragma once

#include <cstdint>
#include <functional>

#include "pace/core/clock.h"

namespace pace::core {

/// \brief Handle of a scheduled timer. kInvalid never names a live timer.
enum class TimerId : uint64_t { kInvalid = 0 };

/// \brief Single-threaded timer primitive.
/// \details Tasks run on the thread that drives the scheduler, one at a time,
/// in deadline order. Tasks sharing a deadline run in the order they were
/// scheduled. Implementations: EventLoop (wall clock) and
/// test::ManualScheduler (simulated clock).
class IScheduler : public IClock {
 public:
  using Task = std::function<void()>;

  /// \brief Runs `task` once `delay` has elapsed. Negative delays count as
  /// zero; a zero delay still defers the task to the scheduler.
  virtual TimerId ScheduleAfter(Duration delay, Task task) = 0;

  /// \brief Drops a pending timer.
  /// \return True if the timer was pending and will no longer fire.
  virtual bool Cancel(TimerId id) = 0;
};

}  // namespace pace::core
