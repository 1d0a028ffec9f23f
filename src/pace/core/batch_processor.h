// Copyright (c) Maia

#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "pace/core/future.h"
#include "pace/core/scheduler.h"
#include "pace/logging.h"

namespace pace::core {

struct BatchOptions {
  static constexpr size_t kDefaultBatchSize = 10;

  size_t batch_size{kDefaultBatchSize};
  // Pause between two slices. Zero still yields to the scheduler.
  IClock::Duration inter_batch_delay{IClock::Duration::zero()};
};

namespace detail {

template <typename Ret>
struct UnwrapFuture {
  using type = std::remove_cvref_t<Ret>;
};

template <typename R>
struct UnwrapFuture<Future<R>> {
  using type = R;
};

template <typename T, typename Transform>
using BatchItemResult = typename UnwrapFuture<
    std::remove_cvref_t<std::invoke_result_t<Transform&, const T&>>>::type;

/// \brief State of one ProcessBatches() call, kept alive by the pending item
/// continuations and the scheduled resumption.
template <typename T, typename R, typename Transform>
class BatchRun : public std::enable_shared_from_this<BatchRun<T, R, Transform>> {
 public:
  BatchRun(IScheduler& scheduler,
           std::vector<T> items,
           Transform transform,
           BatchOptions options)
      : scheduler_(scheduler),
        items_(std::move(items)),
        transform_(std::move(transform)),
        options_(options),
        results_(items_.size()) {}

  Future<std::vector<R>> Start() {
    auto future = promise_.GetFuture();
    RunSlice();
    return future;
  }

 private:
  void RunSlice() {
    const size_t begin = next_index_;
    const size_t end = std::min(begin + options_.batch_size, items_.size());
    next_index_ = end;
    outstanding_ = end - begin;
    ++slice_;

    // Every item of the slice is started before any result is looked at.
    std::vector<Future<R>> started;
    started.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
      started.push_back(Invoke(items_[i]));
    }

    auto self = this->shared_from_this();
    for (size_t i = begin; i < end; ++i) {
      started[i - begin].OnSettled(
          [self, i](const auto& result) { self->OnItemSettled(i, result); });
    }
  }

  Future<R> Invoke(const T& item) {
    try {
      if constexpr (kIsFuture<std::invoke_result_t<Transform&, const T&>>) {
        return std::invoke(transform_, item);
      } else {
        return MakeReadyFuture(R(std::invoke(transform_, item)));
      }
    } catch (...) {
      // A throwing transform fails its item like a failed future would.
      return MakeFailedFuture<R>(std::current_exception());
    }
  }

  void OnItemSettled(size_t index, const typename Future<R>::Result& result) {
    if (failed_) {
      return;
    }
    if (!result) {
      failed_ = true;
      LogDebug("Batch {} failed at item {}; skipping remaining batches.",
               slice_,
               index);
      promise_.SetError(result.error());
      return;
    }

    results_[index] = *result;
    if (--outstanding_ == 0) {
      OnSliceSettled();
    }
  }

  void OnSliceSettled() {
    LogTrace("Batch {} settled, {}/{} items done.",
             slice_,
             next_index_,
             items_.size());
    if (next_index_ >= items_.size()) {
      Finish();
      return;
    }
    auto self = this->shared_from_this();
    scheduler_.ScheduleAfter(options_.inter_batch_delay,
                             [self] { self->RunSlice(); });
  }

  void Finish() {
    std::vector<R> values;
    values.reserve(results_.size());
    for (auto& result : results_) {
      values.push_back(std::move(*result));
    }
    promise_.SetValue(std::move(values));
  }

  IScheduler& scheduler_;
  std::vector<T> items_;
  Transform transform_;
  BatchOptions options_;
  Promise<std::vector<R>> promise_;
  std::vector<std::optional<R>> results_;
  size_t next_index_{0};
  size_t outstanding_{0};
  size_t slice_{0};
  bool failed_{false};
};

}  // namespace detail

/// \brief Runs `transform` over `items` in consecutive slices of at most
/// `options.batch_size` items.
///
/// \details
/// Items within a slice run concurrently; the next slice starts only after
/// every item of the current one settled, resumed through `scheduler` after
/// `options.inter_batch_delay` so large inputs do not monopolise it.
///
/// `transform` maps `const T&` to either `R` or `Future<R>`. Results keep the
/// input order. The first failing item (failed future or thrown exception)
/// fails the whole call with that item's error and no further slice starts.
///
/// \return An error if `batch_size` is zero or the delay is negative.
template <typename T, typename Transform>
  requires std::invocable<Transform&, const T&>
std::expected<Future<std::vector<detail::BatchItemResult<T, Transform>>>,
              std::string>
ProcessBatches(IScheduler& scheduler,
               std::vector<T> items,
               Transform transform,
               BatchOptions options = {}) {
  using R = detail::BatchItemResult<T, Transform>;

  if (options.batch_size == 0) {
    LogWarning("Rejected batch run with a batch size of zero.");
    return std::unexpected(std::string("batch_size must be at least 1"));
  }
  if (options.inter_batch_delay < IClock::Duration::zero()) {
    LogWarning("Rejected batch run with a negative inter-batch delay.");
    return std::unexpected(
        fmt::format("inter_batch_delay must not be negative, got {} ns",
                    options.inter_batch_delay.count()));
  }
  if (items.empty()) {
    return MakeReadyFuture(std::vector<R>{});
  }

  auto run = std::make_shared<detail::BatchRun<T, R, Transform>>(
      scheduler, std::move(items), std::move(transform), options);
  return run->Start();
}

}  // namespace pace::core
