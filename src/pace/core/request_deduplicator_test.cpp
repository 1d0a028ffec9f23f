// Copyright (c) Maia

#include "pace/core/request_deduplicator.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace pace::core {
namespace {

class RequestDeduplicatorTest : public ::testing::Test {
 protected:
  testing::MockFunction<Future<std::string>()> operation_;
  RequestDeduplicator<std::string> dedupe_;
};

TEST_F(RequestDeduplicatorTest, ConcurrentCallsShareOneOperation) {
  Promise<std::string> promise;
  EXPECT_CALL(operation_, Call()).WillOnce(testing::Return(promise.GetFuture()));

  auto first = dedupe_.Dedupe("x", operation_.AsStdFunction());
  auto second = dedupe_.Dedupe("x", operation_.AsStdFunction());

  EXPECT_TRUE(first.SharesStateWith(second));
  EXPECT_TRUE(dedupe_.IsPending("x"));

  promise.SetValue("value");

  EXPECT_EQ(first.Get(), "value");
  EXPECT_EQ(&first.Get(), &second.Get());
  EXPECT_FALSE(dedupe_.IsPending("x"));
}

TEST_F(RequestDeduplicatorTest, DifferentKeysRunSeparately) {
  Promise<std::string> a;
  Promise<std::string> b;
  EXPECT_CALL(operation_, Call())
      .WillOnce(testing::Return(a.GetFuture()))
      .WillOnce(testing::Return(b.GetFuture()));

  auto first = dedupe_.Dedupe("a", operation_.AsStdFunction());
  auto second = dedupe_.Dedupe("b", operation_.AsStdFunction());

  EXPECT_FALSE(first.SharesStateWith(second));
  EXPECT_EQ(dedupe_.PendingCount(), 2);
}

TEST_F(RequestDeduplicatorTest, SettledKeyStartsAFreshOperation) {
  Promise<std::string> first_promise;
  Promise<std::string> second_promise;
  EXPECT_CALL(operation_, Call())
      .WillOnce(testing::Return(first_promise.GetFuture()))
      .WillOnce(testing::Return(second_promise.GetFuture()));

  auto first = dedupe_.Dedupe("x", operation_.AsStdFunction());
  first_promise.SetValue("old");
  auto second = dedupe_.Dedupe("x", operation_.AsStdFunction());

  EXPECT_FALSE(first.SharesStateWith(second));
  EXPECT_TRUE(dedupe_.IsPending("x"));
}

TEST_F(RequestDeduplicatorTest, FailureReachesEveryCallerAndUnblocksTheKey) {
  Promise<std::string> failing;
  EXPECT_CALL(operation_, Call())
      .WillOnce(testing::Return(failing.GetFuture()))
      .WillOnce(testing::Return(MakeReadyFuture(std::string("retry"))));

  auto first = dedupe_.Dedupe("x", operation_.AsStdFunction());
  auto second = dedupe_.Dedupe("x", operation_.AsStdFunction());
  failing.SetError(std::make_exception_ptr(std::runtime_error("offline")));

  EXPECT_TRUE(first.HasError());
  EXPECT_EQ(first.error(), second.error());
  EXPECT_FALSE(dedupe_.IsPending("x"));

  auto retry = dedupe_.Dedupe("x", operation_.AsStdFunction());
  EXPECT_EQ(retry.Get(), "retry");
}

TEST_F(RequestDeduplicatorTest, AlreadySettledOperationIsNotRetained) {
  EXPECT_CALL(operation_, Call())
      .WillOnce(testing::Return(MakeReadyFuture(std::string("now"))));

  auto future = dedupe_.Dedupe("x", operation_.AsStdFunction());

  EXPECT_EQ(future.Get(), "now");
  EXPECT_EQ(dedupe_.PendingCount(), 0);
}

TEST_F(RequestDeduplicatorTest, SynchronousThrowRegistersNothing) {
  EXPECT_CALL(operation_, Call())
      .WillOnce(testing::Throw(std::runtime_error("sync")));

  EXPECT_THROW(
      static_cast<void>(dedupe_.Dedupe("x", operation_.AsStdFunction())),
      std::runtime_error);
  EXPECT_FALSE(dedupe_.IsPending("x"));
}

TEST(RequestDeduplicatorLifetimeTest, OperationMayOutliveTheDeduplicator) {
  Promise<int> promise;
  Future<int> future;
  {
    RequestDeduplicator<int> dedupe;
    future = dedupe.Dedupe("x", [&] { return promise.GetFuture(); });
  }

  promise.SetValue(3);

  EXPECT_EQ(future.Get(), 3);
}

}  // namespace
}  // namespace pace::core
