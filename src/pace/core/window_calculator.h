// Copyright (c) Maia

#pragma once

#include <algorithm>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace pace::core {

/// \brief Scroll position and list geometry, in any consistent unit (pixels,
/// rows, ...).
struct WindowRequest {
  double scroll_offset{0.0};
  double item_extent{0.0};
  double viewport_extent{0.0};
  int64_t overscan{5};
  int64_t total_items{0};
};

/// \brief Range of item indices to materialise, overscan included.
/// \details An empty list yields start_index == 0 and end_index == -1.
/// Otherwise 0 <= start_index <= end_index < total_items.
struct WindowResult {
  int64_t start_index{0};
  int64_t end_index{-1};
  int64_t visible_count{0};
  // Offset of the first materialised item from the top of the list.
  double leading_offset{0.0};
  // Extent of the whole list, total_items * item_extent.
  double total_extent{0.0};

  [[nodiscard]] bool IsEmpty() const {
    return end_index < start_index;
  }

  /// \brief Number of indices in [start_index, end_index].
  [[nodiscard]] int64_t Size() const {
    return IsEmpty() ? 0 : end_index - start_index + 1;
  }

  bool operator==(const WindowResult&) const = default;
};

/// \brief Maps a scroll offset onto the window of items to render.
/// \return An error when item_extent is not a finite positive number, or
/// when viewport_extent, overscan or total_items is negative or non-finite.
std::expected<WindowResult, std::string> ComputeWindow(
    const WindowRequest& request);

/// \brief The items covered by `window`, i.e. items[start_index..end_index].
/// Indices past the end of `items` are clipped.
template <typename T>
std::span<const T> VisibleSlice(std::span<const T> items,
                                const WindowResult& window) {
  if (window.IsEmpty() ||
      window.start_index >= static_cast<int64_t>(items.size())) {
    return {};
  }
  const auto first = static_cast<size_t>(window.start_index);
  const auto last = std::min(static_cast<size_t>(window.end_index) + 1,
                             items.size());
  return items.subspan(first, last - first);
}

}  // namespace pace::core
