// Copyright 2026 The snapreel Authors
// Tests for: snapreel_set_log_level, snapreel_set_log_callback, snapreel_log,
//            EnableCrashLog / DisableCrashLog

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "core/logger.h"
#include "fakes.h"
#include "gtest/gtest.h"
#include "snapreel/snapreel.h"

// ---------------------------------------------------------------------------
// Helper: capture log messages via callback
// ---------------------------------------------------------------------------

struct LogEntry {
  SnapReelLogLevel level;
  std::string message;
};

static void TestLogCallback(SnapReelLogLevel level, const char* message,
                            void* userdata) {
  auto* entries = static_cast<std::vector<LogEntry>*>(userdata);
  entries->push_back({level, message ? message : ""});
}

class LoggingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    entries_.clear();
    snapreel_set_log_level(kSnapReelLogTrace);
    snapreel_set_log_callback(TestLogCallback, &entries_);
  }

  void TearDown() override {
    snapreel_set_log_callback(nullptr, nullptr);
    snapreel_set_log_level(kSnapReelLogInfo);
  }

  bool Logged(const std::string& text) const {
    for (const auto& e : entries_) {
      if (e.message.find(text) != std::string::npos) return true;
    }
    return false;
  }

  std::vector<LogEntry> entries_;
};

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, LogCallbackReceivesMessage) {
  snapreel_log(kSnapReelLogInfo, "test message");
  ASSERT_GE(entries_.size(), 1u);
  EXPECT_TRUE(Logged("test message"));
}

TEST_F(LoggingTest, LogCallbackReceivesCorrectLevel) {
  snapreel_log(kSnapReelLogWarn, "warn msg");

  bool found = false;
  for (const auto& e : entries_) {
    if (e.level == kSnapReelLogWarn &&
        e.message.find("warn msg") != std::string::npos) {
      found = true;
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(LoggingTest, CallbackMessageHasNoTrailingNewline) {
  snapreel_log(kSnapReelLogInfo, "line");
  ASSERT_FALSE(entries_.empty());
  const std::string& m = entries_.back().message;
  ASSERT_FALSE(m.empty());
  EXPECT_NE(m.back(), '\n');
}

TEST_F(LoggingTest, LogLevelFiltering) {
  // Set level to Warn: Info messages should be filtered out.
  snapreel_set_log_level(kSnapReelLogWarn);
  entries_.clear();

  snapreel_log(kSnapReelLogInfo, "should be filtered");
  snapreel_log(kSnapReelLogWarn, "should appear");

  EXPECT_FALSE(Logged("should be filtered"));
  EXPECT_TRUE(Logged("should appear"));
}

TEST_F(LoggingTest, InternalMacrosReachCallback) {
  SNAPREEL_LOG_ERROR("macro {} {}", "value", 42);
  EXPECT_TRUE(Logged("macro value 42"));
}

TEST_F(LoggingTest, UnregisterCallback) {
  snapreel_set_log_callback(nullptr, nullptr);
  entries_.clear();
  snapreel_log(kSnapReelLogInfo, "after unregister");
  EXPECT_FALSE(Logged("after unregister"));
}

TEST_F(LoggingTest, LogNullMessage) {
  // Should not crash.
  snapreel_log(kSnapReelLogInfo, nullptr);
}

TEST_F(LoggingTest, ErrorStringNeverNull) {
  EXPECT_STREQ(snapreel_error_string(kSnapReelOk), "ok");
  EXPECT_STREQ(snapreel_error_string(kSnapReelErrorEmptyOutput), "empty data");
  EXPECT_STREQ(snapreel_error_string(kSnapReelErrorNoCaptureSource),
               "no screen source");
  EXPECT_NE(snapreel_error_string(static_cast<SnapReelError>(-1234)), nullptr);
}

// ---------------------------------------------------------------------------
// Crash log
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, CrashLogKeepsWarningsOnly) {
  snapreel::fakes::TempDir dir;
  std::string path = dir.path() + "/state/crash.log";
  ASSERT_TRUE(snapreel::internal::EnableCrashLog(path));

  snapreel_log(kSnapReelLogInfo, "routine detail");
  snapreel_log(kSnapReelLogError, "something broke");
  snapreel::internal::DisableCrashLog();

  std::ifstream f(path);
  ASSERT_TRUE(f.good());
  std::stringstream ss;
  ss << f.rdbuf();
  std::string contents = ss.str();
  EXPECT_NE(contents.find("something broke"), std::string::npos);
  EXPECT_EQ(contents.find("routine detail"), std::string::npos);
}

TEST_F(LoggingTest, CrashLogUnwritablePathFails) {
  EXPECT_FALSE(snapreel::internal::EnableCrashLog("/proc/snapreel/crash.log"));
  // Logging still works afterwards.
  snapreel_log(kSnapReelLogWarn, "still alive");
  EXPECT_TRUE(Logged("still alive"));
}
