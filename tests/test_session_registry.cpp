// Copyright 2026 The snapreel Authors
// Tests for: SessionRegistry record phase transitions

#include "core/session_registry.h"
#include "gtest/gtest.h"

using snapreel::internal::RecordPhase;
using snapreel::internal::RecordPhaseName;
using snapreel::internal::SessionRegistry;

TEST(SessionRegistryTest, FullLifecycle) {
  SessionRegistry reg;
  EXPECT_TRUE(reg.is_idle());
  EXPECT_TRUE(reg.BeginSelecting());
  EXPECT_FALSE(reg.is_busy());
  EXPECT_TRUE(reg.BeginStarting());
  EXPECT_TRUE(reg.is_busy());
  EXPECT_TRUE(reg.MarkRecording());
  EXPECT_EQ(reg.phase(), RecordPhase::kRecording);
  EXPECT_TRUE(reg.BeginFinalizing());
  EXPECT_TRUE(reg.is_busy());
  reg.Reset();
  EXPECT_TRUE(reg.is_idle());
}

TEST(SessionRegistryTest, StartWithoutSelecting) {
  SessionRegistry reg;
  EXPECT_TRUE(reg.BeginStarting());
  EXPECT_EQ(reg.phase(), RecordPhase::kStarting);
}

TEST(SessionRegistryTest, StopDuringStartup) {
  SessionRegistry reg;
  ASSERT_TRUE(reg.BeginStarting());
  EXPECT_TRUE(reg.BeginFinalizing());
  EXPECT_FALSE(reg.MarkRecording());
}

TEST(SessionRegistryTest, RefusedTransitionsKeepPhase) {
  SessionRegistry reg;
  EXPECT_FALSE(reg.MarkRecording());
  EXPECT_FALSE(reg.BeginFinalizing());
  EXPECT_TRUE(reg.is_idle());

  ASSERT_TRUE(reg.BeginStarting());
  ASSERT_TRUE(reg.MarkRecording());
  EXPECT_FALSE(reg.BeginSelecting());
  EXPECT_FALSE(reg.BeginStarting());
  EXPECT_EQ(reg.phase(), RecordPhase::kRecording);
}

TEST(SessionRegistryTest, PhaseNames) {
  EXPECT_STREQ(RecordPhaseName(RecordPhase::kIdle), "idle");
  EXPECT_STREQ(RecordPhaseName(RecordPhase::kFinalizing), "finalizing");
}
