// Copyright 2026 The snapreel Authors
// Tests for: RecorderWorker mailbox and session events

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "core/recorder_worker.h"
#include "fakes.h"
#include "gtest/gtest.h"

using snapreel::fakes::FakeCaptureBackend;
using snapreel::fakes::FakeEncoderState;
using snapreel::fakes::MakeEncoderFactory;
using namespace snapreel::internal;  // NOLINT

class RecorderWorkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    enc_ = std::make_shared<FakeEncoderState>();
    RecordingSessionManager::Options opts;
    opts.run_compositor_loop = false;
    session_ = std::make_unique<RecordingSessionManager>(
        &capture_, nullptr, MakeEncoderFactory(enc_), PlatformCapabilities(),
        opts);
    worker_ = std::make_unique<RecorderWorker>(session_.get());
    worker_->Attach(&start_channel_, &stop_channel_);
    started_sub_ = worker_->session_started().Subscribe(
        [this](const SelectionRect& rect) {
          std::lock_guard<std::mutex> lock(mutex_);
          started_.push_back(rect);
        });
    finished_sub_ = worker_->recording_finished().Subscribe(
        [this](const SessionResult& result) {
          std::lock_guard<std::mutex> lock(mutex_);
          finished_.push_back(result);
        });
    worker_->Launch();
  }

  void TearDown() override {
    started_sub_.Unsubscribe();
    finished_sub_.Unsubscribe();
    worker_.reset();
    session_.reset();
  }

  AppSettings Settings() {
    AppSettings s = DefaultAppSettings();
    s.audio_source = kSnapReelAudioNone;
    return s;
  }

  FakeCaptureBackend capture_;
  std::shared_ptr<FakeEncoderState> enc_;
  std::unique_ptr<RecordingSessionManager> session_;
  std::unique_ptr<RecorderWorker> worker_;
  EventChannel<SelectionRect, AppSettings> start_channel_;
  EventChannel<> stop_channel_;

  std::mutex mutex_;
  std::vector<SelectionRect> started_;
  std::vector<SessionResult> finished_;
  Subscription started_sub_;
  Subscription finished_sub_;
};

TEST_F(RecorderWorkerTest, StartThenStop) {
  SelectionRect rect{0, 0, 64, 48, 1.0};
  start_channel_.Emit(rect, Settings());
  worker_->Flush();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ASSERT_EQ(started_.size(), 1u);
    EXPECT_EQ(started_[0], rect);
  }
  EXPECT_EQ(session_->state(), SessionState::kRecording);

  worker_->Post([this]() { session_->compositor()->Tick(); });
  stop_channel_.Emit();
  worker_->Flush();
  std::lock_guard<std::mutex> lock(mutex_);
  ASSERT_EQ(finished_.size(), 1u);
  EXPECT_EQ(finished_[0].error, kSnapReelOk);
  EXPECT_EQ(finished_[0].frame_count, 1);
  EXPECT_FALSE(finished_[0].data.empty());
}

TEST_F(RecorderWorkerTest, FailedStartReportsResult) {
  capture_.ClearSources();
  start_channel_.Emit(SelectionRect{0, 0, 64, 48}, Settings());
  worker_->Flush();
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_TRUE(started_.empty());
  ASSERT_EQ(finished_.size(), 1u);
  EXPECT_EQ(finished_[0].error, kSnapReelErrorNoCaptureSource);
}

TEST_F(RecorderWorkerTest, DuplicateStopIsIgnored) {
  start_channel_.Emit(SelectionRect{0, 0, 64, 48}, Settings());
  stop_channel_.Emit();
  stop_channel_.Emit();
  worker_->Flush();
  std::lock_guard<std::mutex> lock(mutex_);
  EXPECT_EQ(finished_.size(), 1u);
}

TEST_F(RecorderWorkerTest, TaskExceptionAbortsSession) {
  start_channel_.Emit(SelectionRect{0, 0, 64, 48}, Settings());
  worker_->Post([]() { throw std::runtime_error("boom"); });
  worker_->Flush();
  EXPECT_EQ(session_->state(), SessionState::kIdle);
  std::lock_guard<std::mutex> lock(mutex_);
  ASSERT_EQ(finished_.size(), 1u);
  EXPECT_EQ(finished_[0].error, kSnapReelErrorUnknown);
}

TEST_F(RecorderWorkerTest, ShutdownAbortsAndDropsLaterTasks) {
  start_channel_.Emit(SelectionRect{0, 0, 64, 48}, Settings());
  worker_->Flush();
  worker_->Shutdown();
  EXPECT_FALSE(worker_->running());
  EXPECT_EQ(session_->state(), SessionState::kIdle);
  EXPECT_TRUE(capture_.video_state->stopped.load());

  std::atomic<bool> ran{false};
  worker_->Post([&]() { ran = true; });
  worker_->Flush();
  EXPECT_FALSE(ran.load());
  // Channels are detached.
  EXPECT_EQ(start_channel_.subscriber_count(), 0u);
  worker_->Shutdown();
}
