// Copyright (c) Maia

#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "pace/core/future.h"
#include "pace/logging.h"

namespace pace::core {

template <typename Op, typename T>
concept CFutureOperation = std::invocable<Op&> &&
                           std::same_as<std::invoke_result_t<Op&>, Future<T>>;

/// \brief Collapses concurrent requests for the same key into one operation.
///
/// \details
/// While an operation for a key is in flight, Dedupe() hands every caller the
/// same Future, so all of them observe one value or one exception object.
/// The registration is removed when the operation settles, on success and on
/// failure alike, so a failed request never blocks later ones.
///
/// There is no cancellation: joining callers can only attach to the result.
/// The deduplicator may be destroyed before its operations settle; their
/// cleanup then does nothing.
template <typename T>
class RequestDeduplicator {
 public:
  RequestDeduplicator()
      : pending_(std::make_shared<PendingMap>()) {}

  RequestDeduplicator(const RequestDeduplicator&) = delete;
  RequestDeduplicator& operator=(const RequestDeduplicator&) = delete;

  /// \brief Returns the in-flight Future for `key`, or starts `operation`.
  /// \details Exceptions thrown synchronously by `operation` propagate to the
  /// caller and nothing is registered.
  template <CFutureOperation<T> Op>
  Future<T> Dedupe(const std::string& key, Op&& operation) {
    if (auto it = pending_->find(key); it != pending_->end()) {
      LogTrace("Joining in-flight request '{}'.", key);
      return it->second;
    }

    Future<T> future = operation();
    (*pending_)[key] = future;

    // Registered after insertion so an already settled future unregisters
    // itself right away.
    std::weak_ptr<PendingMap> weak_pending = pending_;
    future.OnSettled([weak_pending, key](const auto&) {
      auto pending = weak_pending.lock();
      if (!pending) {
        return;
      }
      // Only the settled operation can be registered under `key` here: a
      // newer one is registered only after this entry is gone.
      auto it = pending->find(key);
      if (it != pending->end() && it->second.IsSettled()) {
        pending->erase(it);
      }
    });
    return future;
  }

  [[nodiscard]] bool IsPending(const std::string& key) const {
    return pending_->contains(key);
  }

  [[nodiscard]] size_t PendingCount() const {
    return pending_->size();
  }

 private:
  using PendingMap = std::unordered_map<std::string, Future<T>>;

  // Shared with the cleanup continuations, which hold it weakly.
  std::shared_ptr<PendingMap> pending_;
};

}  // namespace pace::core
