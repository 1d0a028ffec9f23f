// Copyright (c) Maia

#pragma once

#include <chrono>

namespace pace::core {

/// \brief Source of the current time. Injected wherever time matters so tests
/// can drive a simulated clock.
class IClock {
 public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Duration = Clock::duration;

  virtual ~IClock() = default;

  [[nodiscard]] virtual TimePoint Now() const = 0;
};

/// \brief Reads std::chrono::steady_clock.
class SteadyClock : public IClock {
 public:
  [[nodiscard]] TimePoint Now() const override {
    return Clock::now();
  }
};

}  // namespace pace::core
