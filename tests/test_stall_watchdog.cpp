// Copyright 2026 The snapreel Authors
// Tests for: StallWatchdog progress tracking

#include "core/stall_watchdog.h"
#include "gtest/gtest.h"

using snapreel::internal::StallWatchdog;

namespace {
constexpr int64_t kMs = 1000000;
}  // namespace

TEST(StallWatchdogTest, AdvancingPositionNeverStalls) {
  StallWatchdog dog(1000 * kMs);
  for (int i = 1; i <= 100; ++i) {
    EXPECT_FALSE(dog.Sample(i * 500 * kMs, 500 * kMs));
  }
  EXPECT_EQ(dog.stalled_for_ns(), 0);
}

TEST(StallWatchdogTest, FrozenPositionStallsAfterLimit) {
  StallWatchdog dog(1500 * kMs);
  EXPECT_FALSE(dog.Sample(200 * kMs, 500 * kMs));
  EXPECT_FALSE(dog.Sample(200 * kMs, 500 * kMs));
  EXPECT_FALSE(dog.Sample(200 * kMs, 500 * kMs));
  EXPECT_TRUE(dog.Sample(200 * kMs, 500 * kMs));
  EXPECT_TRUE(dog.stalled());
}

TEST(StallWatchdogTest, UnknownPositionCountsAsNoProgress) {
  StallWatchdog dog(1000 * kMs);
  EXPECT_FALSE(dog.Sample(-1, 600 * kMs));
  EXPECT_TRUE(dog.Sample(-1, 600 * kMs));
}

TEST(StallWatchdogTest, ProgressResetsTheCount) {
  StallWatchdog dog(1000 * kMs);
  EXPECT_FALSE(dog.Sample(100 * kMs, 900 * kMs));
  EXPECT_FALSE(dog.Sample(100 * kMs, 900 * kMs));
  EXPECT_FALSE(dog.Sample(300 * kMs, 900 * kMs));
  EXPECT_EQ(dog.stalled_for_ns(), 0);
  EXPECT_FALSE(dog.Sample(300 * kMs, 900 * kMs));
  EXPECT_TRUE(dog.Sample(250 * kMs, 900 * kMs));
}
