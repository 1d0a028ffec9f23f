// Copyright (c) Maia

#include "pace/core/timer_queue.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

namespace pace::core {
namespace {

using namespace std::chrono_literals;

class TimerQueueTest : public ::testing::Test {
 protected:
  IClock::TimePoint At(IClock::Duration offset) const {
    return IClock::TimePoint{} + offset;
  }

  std::vector<std::string> trace_;
  TimerQueue queue_;
};

TEST_F(TimerQueueTest, PopsInDeadlineOrder) {
  queue_.Add(At(30ms), [this] { trace_.push_back("c"); });
  queue_.Add(At(10ms), [this] { trace_.push_back("a"); });
  queue_.Add(At(20ms), [this] { trace_.push_back("b"); });

  while (auto task = queue_.PopDue(At(100ms))) {
    (*task)();
  }

  EXPECT_EQ(trace_, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(queue_.Empty());
}

TEST_F(TimerQueueTest, EqualDeadlinesPopInInsertionOrder) {
  queue_.Add(At(10ms), [this] { trace_.push_back("first"); });
  queue_.Add(At(10ms), [this] { trace_.push_back("second"); });

  while (auto task = queue_.PopDue(At(10ms))) {
    (*task)();
  }

  EXPECT_EQ(trace_, (std::vector<std::string>{"first", "second"}));
}

TEST_F(TimerQueueTest, DoesNotPopFutureTimers) {
  queue_.Add(At(10ms), [] {});

  EXPECT_FALSE(queue_.PopDue(At(9ms)));
  ASSERT_TRUE(queue_.NextDeadline());
  EXPECT_EQ(*queue_.NextDeadline(), At(10ms));
  EXPECT_TRUE(queue_.PopDue(At(10ms)));
}

TEST_F(TimerQueueTest, CancelRemovesTimerOnce) {
  auto id = queue_.Add(At(10ms), [] {});

  EXPECT_TRUE(queue_.IsPending(id));
  EXPECT_TRUE(queue_.Cancel(id));
  EXPECT_FALSE(queue_.IsPending(id));
  EXPECT_FALSE(queue_.Cancel(id));
  EXPECT_FALSE(queue_.NextDeadline());
}

TEST_F(TimerQueueTest, InvalidIdIsNeverPending) {
  EXPECT_NE(queue_.Add(At(0ms), [] {}), TimerId::kInvalid);
  EXPECT_FALSE(queue_.IsPending(TimerId::kInvalid));
  EXPECT_FALSE(queue_.Cancel(TimerId::kInvalid));
}

TEST_F(TimerQueueTest, ClearDropsEverything) {
  auto id = queue_.Add(At(1ms), [] {});
  queue_.Add(At(2ms), [] {});

  queue_.Clear();

  EXPECT_EQ(queue_.Size(), 0);
  EXPECT_FALSE(queue_.IsPending(id));
}

}  // namespace
}  // namespace pace::core
