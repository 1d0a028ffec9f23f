// Copyright (c) Maia

#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <list>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include <entt/signal/sigh.hpp>

#include "pace/assert.h"
#include "pace/core/clock.h"
#include "pace/logging.h"

namespace pace::core {

/// \brief Bounded key/value store with per-entry time-to-live.
///
/// \details
/// **Expiry**: lazy. An entry read more than its ttl after insertion is
/// removed and reported as absent. Nothing sweeps in the background, so
/// Size() may count stale entries.
///
/// **Eviction**: FIFO by insertion. Inserting a new key into a full cache
/// drops the key inserted earliest. Reads never move an entry, and
/// overwriting a key keeps its original position. This is not LRU.
///
/// **Observers**: `sinks().Evicted()` fires for capacity evictions,
/// `sinks().Expired()` for entries dropped by an expired read.
template <typename Key,
          typename Value,
          typename Hash = std::hash<Key>,
          typename KeyEqual = std::equal_to<Key>>
class TtlCache {
 public:
  using TimePoint = IClock::TimePoint;
  using Duration = IClock::Duration;

  static constexpr size_t kDefaultCapacity = 100;
  static constexpr Duration kDefaultTtl = std::chrono::minutes(5);

  /// \throws std::invalid_argument if `capacity` is zero or `default_ttl` is
  /// not positive.
  explicit TtlCache(const IClock& clock,
                    size_t capacity = kDefaultCapacity,
                    Duration default_ttl = kDefaultTtl)
      : clock_(clock),
        capacity_(capacity),
        default_ttl_(default_ttl) {
    if (capacity_ == 0) {
      throw std::invalid_argument("TtlCache capacity must be at least 1");
    }
    if (default_ttl_ <= Duration::zero()) {
      throw std::invalid_argument("TtlCache default ttl must be positive");
    }
  }

  auto sinks() {
    return Sinks{*this};
  }

  /// \brief Stores `value` under `key` with the default ttl.
  std::expected<void, std::string> Set(const Key& key, Value value) {
    return Set(key, std::move(value), default_ttl_);
  }

  /// \brief Stores `value` under `key`, expiring `ttl` after now.
  /// \details May evict the earliest-inserted entry when `key` is new and
  /// the cache is full.
  /// \return An error if `ttl` is not positive; the cache is left untouched.
  std::expected<void, std::string> Set(const Key& key,
                                       Value value,
                                       Duration ttl) {
    if (ttl <= Duration::zero()) {
      LogWarning("Rejected cache entry with non-positive ttl ({} ns).",
                 ttl.count());
      return std::unexpected(std::string("cache ttl must be positive"));
    }

    const auto now = clock_.Now();
    if (auto it = entries_.find(key); it != entries_.end()) {
      it->second.value = std::move(value);
      it->second.inserted_at = now;
      it->second.ttl = ttl;
      return {};
    }

    if (entries_.size() >= capacity_) {
      EvictOldest();
    }

    insertion_order_.push_back(key);
    entries_.emplace(key,
                     Entry{.value = std::move(value),
                           .inserted_at = now,
                           .ttl = ttl,
                           .order = std::prev(insertion_order_.end())});
    Assert(entries_.size() <= capacity_, "cache grew past its capacity");
    return {};
  }

  /// \brief Returns a copy of the value, or nullopt when missing or expired.
  /// \details An expired entry is removed as a side effect. A hit does not
  /// change the eviction order.
  [[nodiscard]] std::optional<Value> Get(const Key& key) {
    auto it = FindLive(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    return it->second.value;
  }

  /// \brief Same as Get(key).has_value(), including the expiry side effect.
  [[nodiscard]] bool Has(const Key& key) {
    return FindLive(key) != entries_.end();
  }

  /// \brief Removes `key`. Returns false if it was not stored.
  bool Erase(const Key& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return false;
    }
    Remove(it);
    return true;
  }

  void Clear() {
    entries_.clear();
    insertion_order_.clear();
  }

  /// \brief Number of stored entries, including ones that have expired but
  /// were not read since.
  [[nodiscard]] size_t Size() const {
    return entries_.size();
  }

  [[nodiscard]] size_t Capacity() const {
    return capacity_;
  }

  [[nodiscard]] Duration DefaultTtl() const {
    return default_ttl_;
  }

 private:
  struct Entry {
    Value value;
    TimePoint inserted_at;
    Duration ttl;
    typename std::list<Key>::iterator order;
  };

  using EntryMap = std::unordered_map<Key, Entry, Hash, KeyEqual>;

  struct Signals {
    entt::sigh<void(const Key&)> evicted;
    entt::sigh<void(const Key&)> expired;
  };

  // clang-format off
  struct Sinks {
    TtlCache& cache;
    auto Evicted() { return entt::sink(cache.signals_.evicted); }
    auto Expired() { return entt::sink(cache.signals_.expired); }
  };

  // clang-format on

  typename EntryMap::iterator FindLive(const Key& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return it;
    }
    const auto age = clock_.Now() - it->second.inserted_at;
    if (age > it->second.ttl) {
      Key expired_key = it->first;
      Remove(it);
      signals_.expired.publish(expired_key);
      return entries_.end();
    }
    return it;
  }

  void EvictOldest() {
    Key victim = insertion_order_.front();
    Remove(entries_.find(victim));
    LogTrace("Cache at capacity {}, evicted earliest inserted entry.",
             capacity_);
    signals_.evicted.publish(victim);
  }

  void Remove(typename EntryMap::iterator it) {
    insertion_order_.erase(it->second.order);
    entries_.erase(it);
  }

  const IClock& clock_;
  size_t capacity_;
  Duration default_ttl_;
  EntryMap entries_;
  // Keys from earliest to latest insertion.
  std::list<Key> insertion_order_;
  Signals signals_;
};

}  // namespace pace::core
