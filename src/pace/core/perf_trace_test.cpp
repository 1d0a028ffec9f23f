// Copyright (c) Maia

#include "pace/core/perf_trace.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace pace::core {
namespace {

class PerfTraceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_ = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output_);
    auto logger = std::make_shared<spdlog::logger>("perf_trace_test", sink);
    logger->set_level(spdlog::level::debug);
    logger->set_pattern("%v");
    spdlog::set_default_logger(logger);
  }

  void TearDown() override {
    spdlog::set_default_logger(previous_);
  }

  std::ostringstream output_;
  std::shared_ptr<spdlog::logger> previous_;
};

TEST_F(PerfTraceTest, ReturnsTheWrappedResult) {
  auto add = Measure("add", [](int a, int b) { return a + b; });

  EXPECT_EQ(add(2, 3), 5);
}

TEST_F(PerfTraceTest, LogsNameAndDuration) {
  auto work = Measure("load rows", [] {});

  work();

  EXPECT_THAT(output_.str(), testing::HasSubstr("[Performance] load rows: "));
  EXPECT_THAT(output_.str(), testing::ContainsRegex("[0-9]+\\.[0-9][0-9]ms"));
}

TEST_F(PerfTraceTest, LogsEvenWhenTheCallThrows) {
  auto failing = Measure("failing", []() -> int {
    throw std::runtime_error("boom");
  });

  EXPECT_THROW(failing(), std::runtime_error);
  EXPECT_THAT(output_.str(), testing::HasSubstr("[Performance] failing:"));
}

TEST_F(PerfTraceTest, ForwardsReferences) {
  int counter = 0;
  auto bump = Measure("bump", [](int& value) -> int& { return ++value; });

  int& result = bump(counter);

  EXPECT_EQ(&result, &counter);
  EXPECT_EQ(counter, 1);
}

}  // namespace
}  // namespace pace::core
