// Copyright (c) Maia

#include "pace/core/future.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

namespace pace::core {
namespace {

TEST(FutureTest, DefaultConstructedIsInvalid) {
  Future<int> future;

  EXPECT_FALSE(future.IsValid());
  EXPECT_FALSE(future.IsSettled());
  EXPECT_FALSE(future.HasValue());
  EXPECT_FALSE(future.HasError());
}

TEST(FutureTest, ContinuationRunsWhenPromiseSettles) {
  Promise<int> promise;
  auto future = promise.GetFuture();
  testing::MockFunction<void(int)> on_value;

  future.OnSettled([&](const auto& result) { on_value.Call(*result); });

  EXPECT_CALL(on_value, Call(42));
  promise.SetValue(42);

  EXPECT_TRUE(future.HasValue());
  EXPECT_EQ(future.Get(), 42);
}

TEST(FutureTest, ContinuationRunsImmediatelyOnSettledFuture) {
  auto future = MakeReadyFuture(std::string("ready"));
  std::string seen;

  future.OnSettled([&](const auto& result) { seen = *result; });

  EXPECT_EQ(seen, "ready");
}

TEST(FutureTest, ContinuationsRunInRegistrationOrder) {
  Promise<int> promise;
  auto future = promise.GetFuture();
  std::string order;

  future.OnSettled([&](const auto&) { order += "a"; });
  future.OnSettled([&](const auto&) { order += "b"; });
  promise.SetValue(1);

  EXPECT_EQ(order, "ab");
}

TEST(FutureTest, ErrorIsSharedByEveryCopy) {
  Promise<int> promise;
  auto first = promise.GetFuture();
  auto second = first;

  promise.SetError(std::make_exception_ptr(std::runtime_error("boom")));

  EXPECT_TRUE(first.HasError());
  EXPECT_TRUE(second.SharesStateWith(first));
  EXPECT_EQ(first.error(), second.error());
  EXPECT_THROW(static_cast<void>(second.Get()), std::runtime_error);
}

TEST(FutureTest, SecondSettlementIsIgnored) {
  Promise<int> promise;
  auto future = promise.GetFuture();
  int calls = 0;
  future.OnSettled([&](const auto&) { ++calls; });

  promise.SetValue(1);
  promise.SetValue(2);
  promise.SetError(std::make_exception_ptr(std::runtime_error("late")));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(future.Get(), 1);
  EXPECT_TRUE(promise.IsSettled());
}

TEST(FutureTest, MakeFailedFutureCarriesTheException) {
  auto future = MakeFailedFuture<std::string>(
      std::make_exception_ptr(std::invalid_argument("bad")));

  EXPECT_TRUE(future.HasError());
  EXPECT_EQ(future.error(), future.result().error());
  EXPECT_THROW(static_cast<void>(future.Get()), std::invalid_argument);
}

TEST(FutureDeathTest, NullErrorIsRejected) {
  Promise<int> promise;

  EXPECT_DEATH(promise.SetError(nullptr), "null exception");
  EXPECT_FALSE(promise.IsSettled());
}

TEST(FutureTest, IsFutureDetectsFutures) {
  static_assert(kIsFuture<Future<int>>);
  static_assert(kIsFuture<const Future<int>&>);
  static_assert(!kIsFuture<int>);
}

}  // namespace
}  // namespace pace::core
