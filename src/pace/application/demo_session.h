// Copyright (c) Maia

#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "pace/application/coordination_config.h"
#include "pace/core/clock.h"
#include "pace/core/window_calculator.h"

namespace pace {

struct DemoOptions {
  // Rows pushed through the batch processor.
  int64_t item_count{1000};
  // Row i looks up id (i / 2) % distinct_rows, so neighbours share a request
  // and later batches revisit cached ids.
  int64_t distinct_rows{250};
  double scroll_offset{0.0};
  // Simulated latency of one row fetch.
  core::IClock::Duration fetch_latency{std::chrono::milliseconds(2)};
  std::vector<std::string> search_keystrokes{"r", "ro", "row", "row-1"};
};

struct DemoReport {
  size_t rows_processed{0};
  size_t fetches{0};
  size_t cache_hits{0};
  size_t joined_requests{0};
  size_t evictions{0};
  size_t progress_reports{0};
  size_t search_runs{0};
  std::string last_search;
  size_t search_matches{0};
  size_t visible_after_reveal{0};
  bool has_more_rows{false};
  core::WindowResult window;
  std::vector<std::string> rows;
};

/// \brief Runs one pass of a table-view consumer on an EventLoop: loads the
/// row ids through the resource registry, resolves every row through the
/// shared cache and the request deduplicator in batches, reports progress
/// through a throttle, debounces a simulated search, then reveals the rows
/// progressively and computes the visible window.
/// \return The collected report, or the error that failed the batch pass.
std::expected<DemoReport, std::string> RunDemo(const CoordinationConfig& config,
                                               const DemoOptions& options);

}  // namespace pace
