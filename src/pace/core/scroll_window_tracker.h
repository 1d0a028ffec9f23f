// Copyright (c) Maia

#pragma once

#include <cstdint>

#include <entt/signal/sigh.hpp>

#include "pace/core/window_calculator.h"

namespace pace::core {

/// \brief Fixed geometry of a virtualised list.
struct WindowGeometry {
  double item_extent{0.0};
  double viewport_extent{0.0};
  int64_t overscan{5};
};

/// \brief Tracks the scroll position of one virtualised list and publishes
/// the window whenever the rendered index range changes.
/// \details Scroll handlers call OnScroll() on every event; listeners only
/// hear about the events that change which rows must be materialised.
class ScrollWindowTracker {
 public:
  /// \throws std::invalid_argument if the geometry or `total_items` would be
  /// rejected by ComputeWindow().
  explicit ScrollWindowTracker(WindowGeometry geometry,
                               int64_t total_items = 0);

  auto sinks() {
    return Sinks{*this};
  }

  /// \return False if `offset` is not finite; the window is unchanged.
  bool OnScroll(double offset);

  /// \return False if `total_items` is negative; the window is unchanged.
  bool SetTotalItems(int64_t total_items);

  [[nodiscard]] const WindowResult& window() const {
    return window_;
  }

  [[nodiscard]] double scroll_offset() const {
    return scroll_offset_;
  }

  [[nodiscard]] int64_t total_items() const {
    return total_items_;
  }

 private:
  struct Signals {
    /// \brief Emitted when start_index, end_index or the list size changed.
    entt::sigh<void(const WindowResult&)> window_changed;
  };

  // clang-format off
  struct Sinks {
    ScrollWindowTracker& tracker;
    auto WindowChanged() { return entt::sink(tracker.signals_.window_changed); }
  };

  // clang-format on

  bool Recompute(double offset, int64_t total_items);

  WindowRequest MakeRequest(double offset, int64_t total_items) const;

  Signals signals_;
  WindowGeometry geometry_;
  double scroll_offset_{0.0};
  int64_t total_items_{0};
  WindowResult window_;
};

}  // namespace pace::core
