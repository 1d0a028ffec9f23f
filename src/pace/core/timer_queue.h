// Copyright (c) Maia

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

#include "pace/core/scheduler.h"

namespace pace::core {

/// \brief Ordered store of pending timers shared by the scheduler
/// implementations.
/// \details Ordered by (deadline, id). Ids grow monotonically, so timers with
/// equal deadlines pop in the order they were added.
class TimerQueue {
 public:
  using TimePoint = IClock::TimePoint;
  using Task = IScheduler::Task;

  TimerId Add(TimePoint deadline, Task task);

  bool Cancel(TimerId id);

  /// \brief Deadline of the earliest pending timer.
  [[nodiscard]] std::optional<TimePoint> NextDeadline() const;

  /// \brief Removes and returns the earliest timer due at `now`, if any.
  [[nodiscard]] std::optional<Task> PopDue(TimePoint now);

  [[nodiscard]] bool IsPending(TimerId id) const;

  [[nodiscard]] size_t Size() const {
    return timers_.size();
  }

  [[nodiscard]] bool Empty() const {
    return timers_.empty();
  }

  void Clear();

 private:
  using Key = std::pair<TimePoint, uint64_t>;

  std::map<Key, Task> timers_;
  std::unordered_map<uint64_t, TimePoint> deadlines_;
  uint64_t next_id_{1};
};

}  // namespace pace::core
