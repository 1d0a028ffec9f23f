// Copyright (c) Maia

#include "pace/core/window_calculator.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <fmt/core.h>

#include "pace/logging.h"

namespace pace::core {

namespace {

// 2^63, the first double past the int64 range.
constexpr double kIndexLimit = 9223372036854775808.0;

// Converts a count or index to int64, clamped to [0, ceiling].
int64_t SaturatingCast(double value, int64_t ceiling) {
  if (!(value > 0.0)) {
    return 0;
  }
  if (value >= std::min(static_cast<double>(ceiling), kIndexLimit)) {
    return ceiling;
  }
  return std::min(ceiling, static_cast<int64_t>(value));
}

std::expected<void, std::string> Validate(const WindowRequest& request) {
  if (!std::isfinite(request.item_extent) || !(request.item_extent > 0.0)) {
    return std::unexpected(fmt::format(
        "item_extent must be a finite positive number, got {}",
        request.item_extent));
  }
  if (!std::isfinite(request.viewport_extent) ||
      request.viewport_extent < 0.0) {
    return std::unexpected(
        fmt::format("viewport_extent must be a finite non-negative number, "
                    "got {}",
                    request.viewport_extent));
  }
  if (!std::isfinite(request.scroll_offset)) {
    return std::unexpected(std::string("scroll_offset must be finite"));
  }
  if (request.overscan < 0) {
    return std::unexpected(fmt::format(
        "overscan must not be negative, got {}", request.overscan));
  }
  if (request.total_items < 0) {
    return std::unexpected(fmt::format(
        "total_items must not be negative, got {}", request.total_items));
  }
  return {};
}

}  // namespace

std::expected<WindowResult, std::string> ComputeWindow(
    const WindowRequest& request) {
  if (auto valid = Validate(request); !valid) {
    LogWarning("Rejected window request: {}", valid.error());
    return std::unexpected(valid.error());
  }

  WindowResult result;
  // A tiny item extent makes the quotient exceed int64; saturate instead.
  result.visible_count =
      SaturatingCast(std::ceil(request.viewport_extent / request.item_extent),
                     std::numeric_limits<int64_t>::max());
  result.total_extent =
      static_cast<double>(request.total_items) * request.item_extent;

  if (request.total_items == 0) {
    return result;
  }

  const double first_in_view =
      std::floor(request.scroll_offset / request.item_extent);
  const int64_t last_index = request.total_items - 1;

  // Computed in floating point so huge offsets, counts and overscans cannot
  // overflow. Scrolled past the end (e.g. the list shrank): keep the tail in
  // view.
  result.start_index = SaturatingCast(
      first_in_view - static_cast<double>(request.overscan), last_index);
  const double span = static_cast<double>(result.visible_count) +
                      2.0 * static_cast<double>(request.overscan);
  result.end_index = std::max(
      result.start_index,
      SaturatingCast(static_cast<double>(result.start_index) + span,
                     last_index));
  result.leading_offset =
      static_cast<double>(result.start_index) * request.item_extent;
  return result;
}

}  // namespace pace::core
