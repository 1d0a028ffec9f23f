// Copyright (c) Maia

#include "pace/application/demo_session.h"

#include <algorithm>
#include <exception>
#include <utility>

#include <fmt/core.h>

#include "pace/application/composition_root.h"
#include "pace/core/batch_processor.h"
#include "pace/core/event_loop.h"
#include "pace/core/future.h"
#include "pace/core/perf_trace.h"
#include "pace/core/progressive_loader.h"
#include "pace/core/request_deduplicator.h"
#include "pace/core/resource_registry.h"
#include "pace/core/scroll_window_tracker.h"
#include "pace/core/throttle.h"
#include "pace/logging.h"

namespace pace {

namespace {

constexpr auto kKeystrokeSpacing = std::chrono::milliseconds(10);
constexpr const char* kRowIdsResource = "row-ids";

struct EvictionCounter {
  size_t count{0};

  void OnEvicted(const std::string& key) {
    ++count;
    LogTrace("Evicted {} from the shared cache.", key);
  }
};

std::string DescribeError(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

std::string RowKey(int64_t id) {
  return fmt::format("row:{}", id);
}

}  // namespace

std::expected<DemoReport, std::string> RunDemo(const CoordinationConfig& config,
                                               const DemoOptions& options) {
  if (options.item_count < 0) {
    return std::unexpected(fmt::format("item_count must not be negative, got {}",
                                       options.item_count));
  }
  if (options.distinct_rows < 1) {
    return std::unexpected(fmt::format(
        "distinct_rows must be at least 1, got {}", options.distinct_rows));
  }

  if (options.fetch_latency < core::IClock::Duration::zero() ||
      options.fetch_latency > std::chrono::milliseconds(kMaxDurationMs)) {
    return std::unexpected(std::string("fetch_latency out of range"));
  }

  DemoReport report;
  core::EventLoop loop;

  auto cache = MakeSharedCache(config, loop);
  EvictionCounter evictions;
  cache->sinks().Evicted().connect<&EvictionCounter::OnEvicted>(evictions);

  core::ResourceRegistry<std::vector<int64_t>> registry;
  registry.Register(kRowIdsResource, [&options] {
    std::vector<int64_t> ids;
    ids.reserve(static_cast<size_t>(options.item_count));
    for (int64_t i = 0; i < options.item_count; ++i) {
      ids.push_back((i / 2) % options.distinct_rows);
    }
    return core::MakeReadyFuture(std::move(ids));
  });

  auto row_ids = registry.Load(kRowIdsResource);
  if (row_ids.HasError()) {
    return std::unexpected(DescribeError(row_ids.error()));
  }

  auto fetch_row = [&loop, &report, &options](int64_t id) {
    ++report.fetches;
    core::Promise<std::string> promise;
    loop.ScheduleAfter(options.fetch_latency, [promise, id]() mutable {
      promise.SetValue(fmt::format("row-{}", id));
    });
    return promise.GetFuture();
  };

  size_t rows_done = 0;
  core::Throttle<size_t> progress(
      loop,
      [&report, total = options.item_count](size_t done) {
        ++report.progress_reports;
        LogInfo("Resolved {}/{} rows.", done, total);
      },
      config.ThrottleWait());

  core::RequestDeduplicator<std::string> dedupe;
  auto lookup = [&](int64_t id) -> core::Future<std::string> {
    const std::string key = RowKey(id);
    if (auto hit = cache->Get(key)) {
      ++report.cache_hits;
      progress(++rows_done);
      return core::MakeReadyFuture(std::move(*hit));
    }
    if (dedupe.IsPending(key)) {
      ++report.joined_requests;
    }
    auto future = dedupe.Dedupe(key, [&] { return fetch_row(id); });
    future.OnSettled([&, key](const auto& result) {
      if (!result) {
        return;
      }
      if (auto stored = cache->Set(key, *result); !stored) {
        LogWarning("Failed to cache {}: {}", key, stored.error());
      }
      progress(++rows_done);
    });
    return future;
  };

  auto batches = core::ProcessBatches(
      loop, row_ids.Get(), lookup, config.ToBatchOptions());
  if (!batches) {
    return std::unexpected(batches.error());
  }

  core::Debouncer<std::string> search(
      loop,
      [&report](const std::string& query) {
        ++report.search_runs;
        report.last_search = query;
      },
      config.DebounceDelay());
  for (size_t i = 0; i < options.search_keystrokes.size(); ++i) {
    loop.ScheduleAfter(kKeystrokeSpacing * static_cast<int64_t>(i),
                       [&search, query = options.search_keystrokes[i]] {
                         search(query);
                       });
  }

  auto drive = core::Measure("coordination pass",
                             [&loop] { return loop.RunUntilIdle(); });
  const size_t tasks = drive();
  LogDebug("Event loop ran {} tasks.", tasks);

  if (batches->HasError()) {
    return std::unexpected(DescribeError(batches->error()));
  }
  report.rows = batches->Get();
  report.rows_processed = report.rows.size();
  report.evictions = evictions.count;
  report.search_matches = static_cast<size_t>(
      std::ranges::count_if(report.rows, [&report](const std::string& row) {
        return !report.last_search.empty() &&
               row.starts_with(report.last_search);
      }));

  core::ProgressiveLoader<std::string> loader(report.rows,
                                              config.ToProgressiveLoadConfig());
  loader.Advance();
  report.visible_after_reveal = loader.VisibleCount();
  report.has_more_rows = loader.HasMore();

  core::ScrollWindowTracker tracker(config.ToWindowGeometry(),
                                    static_cast<int64_t>(report.rows.size()));
  if (!tracker.OnScroll(options.scroll_offset)) {
    return std::unexpected(
        fmt::format("invalid scroll offset {}", options.scroll_offset));
  }
  report.window = tracker.window();

  LogInfo(
      "Resolved {} rows with {} fetches, {} cache hits and {} joined "
      "requests.",
      report.rows_processed,
      report.fetches,
      report.cache_hits,
      report.joined_requests);
  LogInfo("Window at offset {}: rows {}..{} of {}.",
          options.scroll_offset,
          report.window.start_index,
          report.window.end_index,
          report.rows_processed);
  return report;
}

}  // namespace pace
