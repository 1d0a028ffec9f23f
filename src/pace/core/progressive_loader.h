// Copyright (c) Maia

#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <entt/signal/sigh.hpp>

namespace pace::core {

struct ProgressiveLoadConfig {
  size_t initial_count{0};
  size_t increment{0};
  // Defaults to the number of items.
  std::optional<size_t> max_count;
};

/// \brief Reveals a growing prefix of an in-memory collection.
/// \details Nothing is fetched: the whole collection is already held, and
/// Advance() only widens the visible prefix, up to
/// min(max_count, item count). The visible count never shrinks until the
/// loader is initialised again.
template <typename T>
class ProgressiveLoader {
 public:
  ProgressiveLoader() = default;

  ProgressiveLoader(std::vector<T> items, const ProgressiveLoadConfig& config) {
    Initialize(std::move(items), config);
  }

  auto sinks() {
    return Sinks{*this};
  }

  void Initialize(std::vector<T> items, const ProgressiveLoadConfig& config) {
    items_ = std::move(items);
    increment_ = config.increment;
    max_count_ = config.max_count.value_or(items_.size());
    visible_count_ = std::min({config.initial_count, max_count_, Ceiling()});
  }

  /// \brief Reveals up to `increment` more items. No-op once saturated.
  void Advance() {
    // Bounded by the room left so a huge increment cannot wrap around.
    const size_t room = Ceiling() - visible_count_;
    const size_t next = visible_count_ + std::min(increment_, room);
    if (next == visible_count_) {
      return;
    }
    visible_count_ = next;
    signals_.visible_count_changed.publish(visible_count_);
  }

  [[nodiscard]] std::span<const T> VisibleItems() const {
    return std::span<const T>(items_).first(visible_count_);
  }

  [[nodiscard]] bool HasMore() const {
    return visible_count_ < Ceiling();
  }

  [[nodiscard]] size_t VisibleCount() const {
    return visible_count_;
  }

  [[nodiscard]] size_t TotalCount() const {
    return items_.size();
  }

 private:
  struct Signals {
    /// \brief Emitted by Advance() with the new visible count.
    entt::sigh<void(size_t /* visible_count */)> visible_count_changed;
  };

  // clang-format off
  struct Sinks {
    ProgressiveLoader& loader;
    auto VisibleCountChanged() { return entt::sink(loader.signals_.visible_count_changed); }
  };

  // clang-format on

  size_t Ceiling() const {
    return std::min(max_count_, items_.size());
  }

  Signals signals_;
  std::vector<T> items_;
  size_t increment_{0};
  size_t max_count_{0};
  size_t visible_count_{0};
};

}  // namespace pace::core
