// Copyright (c) Maia

#include "pace/application/composition_root.h"

#include <gtest/gtest.h>

#include <chrono>

#include "pace/tests/manual_scheduler.h"

namespace pace {
namespace {

using namespace std::chrono_literals;

TEST(CompositionRootTest, SharedCacheFollowsConfiguration) {
  test::ManualScheduler clock;
  CoordinationConfig config;
  config.cache.capacity = 2;
  config.cache.default_ttl_ms = 10;

  auto cache = MakeSharedCache(config, clock);

  ASSERT_NE(cache, nullptr);
  EXPECT_EQ(cache->Capacity(), 2);
  EXPECT_EQ(cache->DefaultTtl(), 10ms);

  ASSERT_TRUE(cache->Set("users", "[]"));
  clock.AdvanceBy(11ms);
  EXPECT_FALSE(cache->Has("users"));
}

TEST(CompositionRootTest, EveryCallBuildsAnIndependentCache) {
  core::SteadyClock clock;
  CoordinationConfig config;

  auto first = MakeSharedCache(config, clock);
  auto second = MakeSharedCache(config, clock);
  ASSERT_TRUE(first->Set("k", "v"));

  EXPECT_EQ(first->Capacity(), 200);
  EXPECT_TRUE(first->Has("k"));
  EXPECT_FALSE(second->Has("k"));
}

}  // namespace
}  // namespace pace
