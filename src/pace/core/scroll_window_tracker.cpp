// Copyright (c) Maia

#include "pace/core/scroll_window_tracker.h"

#include <stdexcept>

namespace pace::core {

ScrollWindowTracker::ScrollWindowTracker(WindowGeometry geometry,
                                         int64_t total_items)
    : geometry_(geometry),
      total_items_(total_items) {
  auto initial = ComputeWindow(MakeRequest(0.0, total_items));
  if (!initial) {
    throw std::invalid_argument(initial.error());
  }
  window_ = *initial;
}

bool ScrollWindowTracker::OnScroll(double offset) {
  return Recompute(offset, total_items_);
}

bool ScrollWindowTracker::SetTotalItems(int64_t total_items) {
  return Recompute(scroll_offset_, total_items);
}

bool ScrollWindowTracker::Recompute(double offset, int64_t total_items) {
  auto next = ComputeWindow(MakeRequest(offset, total_items));
  if (!next) {
    return false;
  }

  scroll_offset_ = offset;
  total_items_ = total_items;

  const bool range_changed = next->start_index != window_.start_index ||
                             next->end_index != window_.end_index ||
                             next->total_extent != window_.total_extent;
  window_ = *next;
  if (range_changed) {
    signals_.window_changed.publish(window_);
  }
  return true;
}

WindowRequest ScrollWindowTracker::MakeRequest(double offset,
                                               int64_t total_items) const {
  return WindowRequest{.scroll_offset = offset,
                       .item_extent = geometry_.item_extent,
                       .viewport_extent = geometry_.viewport_extent,
                       .overscan = geometry_.overscan,
                       .total_items = total_items};
}

}  // namespace pace::core
