// Copyright (c) Maia

#include "pace/core/timer_queue.h"

#include "pace/assert.h"

namespace pace::core {

TimerId TimerQueue::Add(TimePoint deadline, Task task) {
  const uint64_t id = next_id_++;
  timers_.emplace(Key{deadline, id}, std::move(task));
  deadlines_.emplace(id, deadline);
  return static_cast<TimerId>(id);
}

bool TimerQueue::Cancel(TimerId id) {
  auto it = deadlines_.find(static_cast<uint64_t>(id));
  if (it == deadlines_.end()) {
    return false;
  }
  timers_.erase(Key{it->second, it->first});
  deadlines_.erase(it);
  return true;
}

std::optional<TimerQueue::TimePoint> TimerQueue::NextDeadline() const {
  if (timers_.empty()) {
    return std::nullopt;
  }
  return timers_.begin()->first.first;
}

std::optional<TimerQueue::Task> TimerQueue::PopDue(TimePoint now) {
  if (timers_.empty()) {
    return std::nullopt;
  }
  auto it = timers_.begin();
  if (it->first.first > now) {
    return std::nullopt;
  }
  Task task = std::move(it->second);
  deadlines_.erase(it->first.second);
  timers_.erase(it);
  Assert(timers_.size() == deadlines_.size(), "timer index out of sync");
  return task;
}

bool TimerQueue::IsPending(TimerId id) const {
  return deadlines_.contains(static_cast<uint64_t>(id));
}

void TimerQueue::Clear() {
  timers_.clear();
  deadlines_.clear();
}

}  // namespace pace::core
