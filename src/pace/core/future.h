// Copyright (c) Maia

#pragma once

#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

#include "pace/assert.h"
#include "pace/logging.h"

namespace pace::core {

template <typename T>
class Promise;

namespace detail {

template <typename T>
struct FutureState {
  using Result = std::expected<T, std::exception_ptr>;
  using Continuation = std::function<void(const Result&)>;

  void Settle(Result settled) {
    if (result) {
      LogWarning("Ignoring second settlement of an already settled promise.");
      return;
    }
    result = std::move(settled);
    // Continuations may register further continuations on this state; those
    // run immediately because `result` is already set.
    auto pending = std::move(continuations);
    continuations.clear();
    for (auto& continuation : pending) {
      continuation(*result);
    }
  }

  std::optional<Result> result;
  std::vector<Continuation> continuations;
};

}  // namespace detail

/// \brief Read side of a single-threaded asynchronous result.
/// \details Copies share one state: every holder observes the same value or
/// the same exception object. Continuations run on the thread that settles
/// the promise, in registration order, or immediately when registered on a
/// settled future.
template <typename T>
class Future {
  static_assert(!std::is_void_v<T>, "Future<void> is not supported");
  static_assert(!std::is_reference_v<T>, "Future<T&> is not supported");

 public:
  using ValueType = T;
  using Result = std::expected<T, std::exception_ptr>;
  using Continuation = std::function<void(const Result&)>;

  /// \brief Creates an invalid future that is not attached to any promise.
  Future() = default;

  [[nodiscard]] bool IsValid() const {
    return state_ != nullptr;
  }

  [[nodiscard]] bool IsSettled() const {
    return state_ && state_->result.has_value();
  }

  [[nodiscard]] bool HasValue() const {
    return IsSettled() && state_->result->has_value();
  }

  [[nodiscard]] bool HasError() const {
    return IsSettled() && !state_->result->has_value();
  }

  /// \brief The settled outcome. Must only be called once settled.
  [[nodiscard]] const Result& result() const {
    Assert(IsSettled(), "result() called on an unsettled future");
    return *state_->result;
  }

  /// \brief The settled value; rethrows the stored exception on failure.
  [[nodiscard]] const T& Get() const {
    const auto& settled = result();
    if (!settled) {
      std::rethrow_exception(settled.error());
    }
    return *settled;
  }

  /// \brief The stored exception, or nullptr when unsettled or successful.
  [[nodiscard]] std::exception_ptr error() const {
    return HasError() ? state_->result->error() : nullptr;
  }

  void OnSettled(Continuation continuation) const {
    Assert(IsValid(), "OnSettled() called on an invalid future");
    if (state_->result) {
      continuation(*state_->result);
      return;
    }
    state_->continuations.push_back(std::move(continuation));
  }

  /// \brief True when both handles observe the same operation.
  [[nodiscard]] bool SharesStateWith(const Future& other) const {
    return state_ && state_ == other.state_;
  }

 private:
  friend class Promise<T>;

  explicit Future(std::shared_ptr<detail::FutureState<T>> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::FutureState<T>> state_;
};

/// \brief Write side of a Future. Settles exactly once; later settlements are
/// logged and ignored.
template <typename T>
class Promise {
 public:
  Promise()
      : state_(std::make_shared<detail::FutureState<T>>()) {}

  [[nodiscard]] Future<T> GetFuture() const {
    return Future<T>(state_);
  }

  void SetValue(T value) {
    state_->Settle(typename Future<T>::Result(std::move(value)));
  }

  /// \brief `error` must not be null.
  void SetError(std::exception_ptr error) {
    Assert(error != nullptr, "SetError() called with a null exception");
    state_->Settle(std::unexpected(std::move(error)));
  }

  [[nodiscard]] bool IsSettled() const {
    return state_->result.has_value();
  }

 private:
  std::shared_ptr<detail::FutureState<T>> state_;
};

template <typename T>
Future<std::decay_t<T>> MakeReadyFuture(T&& value) {
  Promise<std::decay_t<T>> promise;
  promise.SetValue(std::forward<T>(value));
  return promise.GetFuture();
}

template <typename T>
Future<T> MakeFailedFuture(std::exception_ptr error) {
  Promise<T> promise;
  promise.SetError(std::move(error));
  return promise.GetFuture();
}

template <typename T>
struct IsFuture : std::false_type {};

template <typename T>
struct IsFuture<Future<T>> : std::true_type {};

template <typename T>
inline constexpr bool kIsFuture = IsFuture<std::remove_cvref_t<T>>::value;

}  // namespace pace::core
