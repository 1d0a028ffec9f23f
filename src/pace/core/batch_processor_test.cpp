// Copyright (c) Maia

#include "pace/core/batch_processor.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "pace/tests/manual_scheduler.h"

namespace pace::core {
namespace {

using namespace std::chrono_literals;
using ::testing::ElementsAre;

class BatchProcessorTest : public ::testing::Test {
 protected:
  test::ManualScheduler scheduler_;
};

TEST_F(BatchProcessorTest, SquaresInInputOrder) {
  auto result = ProcessBatches(
      scheduler_,
      std::vector<int>{1, 2, 3, 4, 5},
      [](int x) { return x * x; },
      BatchOptions{.batch_size = 2});
  ASSERT_TRUE(result);

  scheduler_.RunPending();

  ASSERT_TRUE(result->HasValue());
  EXPECT_THAT(result->Get(), ElementsAre(1, 4, 9, 16, 25));
}

TEST_F(BatchProcessorTest, KeepsOrderWhenItemsSettleOutOfOrder) {
  // Later items of a slice finish first.
  auto result = ProcessBatches(
      scheduler_,
      std::vector<int>{1, 2, 3, 4, 5},
      [this](int x) {
        Promise<int> promise;
        scheduler_.ScheduleAfter(std::chrono::milliseconds(10 - x),
                                 [promise, x]() mutable {
                                   promise.SetValue(x * x);
                                 });
        return promise.GetFuture();
      },
      BatchOptions{.batch_size = 2});
  ASSERT_TRUE(result);

  scheduler_.AdvanceBy(1s);

  EXPECT_THAT(result->Get(), ElementsAre(1, 4, 9, 16, 25));
}

TEST_F(BatchProcessorTest, StartsNextSliceOnlyAfterCurrentOneSettled) {
  std::vector<int> started;
  std::vector<Promise<int>> promises;
  auto result = ProcessBatches(
      scheduler_,
      std::vector<int>{1, 2, 3},
      [&](int x) {
        started.push_back(x);
        promises.emplace_back();
        return promises.back().GetFuture();
      },
      BatchOptions{.batch_size = 2});
  ASSERT_TRUE(result);

  EXPECT_THAT(started, ElementsAre(1, 2));

  promises[0].SetValue(1);
  scheduler_.RunPending();
  EXPECT_THAT(started, ElementsAre(1, 2));

  promises[1].SetValue(2);
  EXPECT_THAT(started, ElementsAre(1, 2));
  scheduler_.RunPending();
  EXPECT_THAT(started, ElementsAre(1, 2, 3));

  promises[2].SetValue(3);
  EXPECT_THAT(result->Get(), ElementsAre(1, 2, 3));
}

TEST_F(BatchProcessorTest, HonoursInterBatchDelay) {
  std::vector<int> started;
  auto result = ProcessBatches(
      scheduler_,
      std::vector<int>{1, 2, 3, 4},
      [&](int x) {
        started.push_back(x);
        return x;
      },
      BatchOptions{.batch_size = 2, .inter_batch_delay = 50ms});
  ASSERT_TRUE(result);

  scheduler_.AdvanceBy(49ms);
  EXPECT_EQ(started.size(), 2);

  scheduler_.AdvanceBy(1ms);
  EXPECT_EQ(started.size(), 4);
  EXPECT_TRUE(result->HasValue());
}

TEST_F(BatchProcessorTest, FirstFailureFailsTheRunAndStopsLaterSlices) {
  std::vector<int> started;
  auto result = ProcessBatches(
      scheduler_,
      std::vector<int>{1, 2, 3, 4, 5},
      [&](int x) -> Future<std::string> {
        started.push_back(x);
        if (x == 2) {
          return MakeFailedFuture<std::string>(
              std::make_exception_ptr(std::runtime_error("item 2")));
        }
        return MakeReadyFuture(std::to_string(x));
      },
      BatchOptions{.batch_size = 2});
  ASSERT_TRUE(result);

  scheduler_.AdvanceBy(1s);

  ASSERT_TRUE(result->HasError());
  EXPECT_THROW(static_cast<void>(result->Get()), std::runtime_error);
  EXPECT_THAT(started, ElementsAre(1, 2));
}

TEST_F(BatchProcessorTest, ThrowingTransformFailsTheRun) {
  auto result = ProcessBatches(
      scheduler_,
      std::vector<int>{1, 2, 3},
      [](int x) -> int {
        if (x == 3) {
          throw std::out_of_range("three");
        }
        return x;
      },
      BatchOptions{.batch_size = 2});
  ASSERT_TRUE(result);

  scheduler_.RunPending();

  ASSERT_TRUE(result->HasError());
  EXPECT_THROW(static_cast<void>(result->Get()), std::out_of_range);
}

TEST_F(BatchProcessorTest, EmptyInputSettlesImmediately) {
  auto result = ProcessBatches(
      scheduler_, std::vector<int>{}, [](int x) { return x; });
  ASSERT_TRUE(result);

  ASSERT_TRUE(result->HasValue());
  EXPECT_TRUE(result->Get().empty());
  EXPECT_EQ(scheduler_.PendingCount(), 0);
}

TEST_F(BatchProcessorTest, RejectsInvalidOptions) {
  auto identity = [](int x) { return x; };

  EXPECT_FALSE(ProcessBatches(scheduler_,
                              std::vector<int>{1},
                              identity,
                              BatchOptions{.batch_size = 0}));
  EXPECT_FALSE(ProcessBatches(
      scheduler_,
      std::vector<int>{1},
      identity,
      BatchOptions{.batch_size = 1, .inter_batch_delay = -1ms}));
}

TEST_F(BatchProcessorTest, DefaultBatchSizeIsTen) {
  EXPECT_EQ(BatchOptions{}.batch_size, 10);
}

}  // namespace
}  // namespace pace::core
