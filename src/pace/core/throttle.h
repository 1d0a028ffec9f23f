// Copyright (c) Maia

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <utility>

#include "pace/core/scheduler.h"
#include "pace/logging.h"

namespace pace::core {

/// \brief Rate-limits a callback to at most one invocation per `wait`.
///
/// \details
/// - **Leading edge**: a call made at least `wait` after the last invocation
///   (or the very first call) runs immediately.
/// - **Trailing edge**: a call made sooner arms one timer for the remaining
///   time, carrying that call's arguments. Calls made while the timer is
///   armed are dropped; they replace neither the timer nor its arguments.
/// - **Disposal**: Cancel() drops the armed call, and destruction cancels it,
///   so the callback never runs after its owner is gone.
///
/// The scheduler must outlive the throttle.
template <typename... Args>
class Throttle {
 public:
  using Callback = std::function<void(Args...)>;
  using Duration = IClock::Duration;
  using TimePoint = IClock::TimePoint;

  /// \throws std::invalid_argument if `wait` is not positive or `callback` is
  /// empty.
  Throttle(IScheduler& scheduler, Callback callback, Duration wait)
      : scheduler_(scheduler),
        callback_(std::move(callback)),
        wait_(wait) {
    if (wait_ <= Duration::zero()) {
      throw std::invalid_argument("Throttle wait must be positive");
    }
    if (!callback_) {
      throw std::invalid_argument("Throttle callback must not be empty");
    }
  }

  Throttle(const Throttle&) = delete;
  Throttle& operator=(const Throttle&) = delete;

  ~Throttle() {
    Cancel();
  }

  void operator()(Args... args) {
    const auto now = scheduler_.Now();
    // A clock that went backwards counts as "long enough ago".
    const bool elapsed = !last_invocation_ || now < *last_invocation_ ||
                         now - *last_invocation_ >= wait_;
    if (elapsed) {
      Cancel();
      last_invocation_ = now;
      callback_(std::forward<Args>(args)...);
      return;
    }

    if (pending_timer_) {
      return;
    }

    const auto remaining = wait_ - (now - *last_invocation_);
    pending_timer_ = scheduler_.ScheduleAfter(
        remaining,
        [this, captured = std::make_tuple(std::decay_t<Args>(args)...)]() mutable {
          pending_timer_.reset();
          last_invocation_ = scheduler_.Now();
          std::apply(callback_, std::move(captured));
        });
  }

  /// \brief Drops the armed trailing call, if any.
  /// \return True if a call was dropped.
  bool Cancel() {
    if (!pending_timer_) {
      return false;
    }
    const bool cancelled = scheduler_.Cancel(*pending_timer_);
    pending_timer_.reset();
    if (cancelled) {
      LogTrace("Dropped pending throttled call.");
    }
    return cancelled;
  }

  [[nodiscard]] bool HasPendingCall() const {
    return pending_timer_.has_value();
  }

  [[nodiscard]] Duration wait() const {
    return wait_;
  }

 private:
  IScheduler& scheduler_;
  Callback callback_;
  Duration wait_;
  std::optional<TimePoint> last_invocation_;
  std::optional<TimerId> pending_timer_;
};

/// \brief Delays a callback until calls stop arriving for `delay`, then runs
/// it once with the arguments of the latest call.
/// \details Backs search boxes and other inputs that fire on every keystroke.
/// The scheduler must outlive the debouncer.
template <typename... Args>
class Debouncer {
 public:
  using Callback = std::function<void(Args...)>;
  using Duration = IClock::Duration;

  static constexpr Duration kDefaultDelay = std::chrono::milliseconds(300);

  /// \throws std::invalid_argument if `delay` is negative or `callback` is
  /// empty.
  Debouncer(IScheduler& scheduler,
            Callback callback,
            Duration delay = kDefaultDelay)
      : scheduler_(scheduler),
        callback_(std::move(callback)),
        delay_(delay) {
    if (delay_ < Duration::zero()) {
      throw std::invalid_argument("Debouncer delay must not be negative");
    }
    if (!callback_) {
      throw std::invalid_argument("Debouncer callback must not be empty");
    }
  }

  Debouncer(const Debouncer&) = delete;
  Debouncer& operator=(const Debouncer&) = delete;

  ~Debouncer() {
    Cancel();
  }

  void operator()(Args... args) {
    if (pending_timer_) {
      scheduler_.Cancel(*pending_timer_);
    }
    pending_args_.emplace(std::decay_t<Args>(args)...);
    pending_timer_ = scheduler_.ScheduleAfter(delay_, [this] { Fire(); });
  }

  /// \brief Drops the pending call, if any.
  /// \return True if a call was dropped.
  bool Cancel() {
    if (!pending_timer_) {
      return false;
    }
    scheduler_.Cancel(*pending_timer_);
    pending_timer_.reset();
    pending_args_.reset();
    return true;
  }

  /// \brief Runs the pending call now instead of waiting for the timer.
  /// \return True if a call was pending.
  bool Flush() {
    if (!pending_timer_) {
      return false;
    }
    scheduler_.Cancel(*pending_timer_);
    Fire();
    return true;
  }

  [[nodiscard]] bool HasPendingCall() const {
    return pending_timer_.has_value();
  }

 private:
  void Fire() {
    pending_timer_.reset();
    auto args = std::move(*pending_args_);
    pending_args_.reset();
    std::apply(callback_, std::move(args));
  }

  IScheduler& scheduler_;
  Callback callback_;
  Duration delay_;
  std::optional<std::tuple<std::decay_t<Args>...>> pending_args_;
  std::optional<TimerId> pending_timer_;
};

}  // namespace pace::core
