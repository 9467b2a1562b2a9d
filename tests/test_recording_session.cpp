// Copyright 2026 The snapreel Authors
// Tests for: RecordingSessionManager start/stop, audio routing, error priority

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "core/recording_session.h"
#include "fakes.h"
#include "gtest/gtest.h"

using snapreel::fakes::FakeAudioBackend;
using snapreel::fakes::FakeCaptureBackend;
using snapreel::fakes::FakeEncoderState;
using snapreel::fakes::MakeEncoderFactory;
using namespace snapreel::internal;  // NOLINT

class RecordingSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    enc_ = std::make_shared<FakeEncoderState>();
    RecordingSessionManager::Options opts;
    opts.run_compositor_loop = false;
    session_ = std::make_unique<RecordingSessionManager>(
        &capture_, &audio_, MakeEncoderFactory(enc_), caps_, opts);
  }

  RecordingRequest Request(SnapReelAudioSource audio = kSnapReelAudioNone) {
    RecordingRequest req;
    req.rect = SelectionRect{10, 10, 101, 61, 1.0};
    req.settings = DefaultAppSettings();
    req.settings.audio_source = audio;
    return req;
  }

  void TickFrames(int n) {
    for (int i = 0; i < n; ++i) {
      ASSERT_EQ(session_->compositor()->Tick(),
                FrameCompositor::TickResult::kDrawn);
    }
  }

  FakeCaptureBackend capture_;
  FakeAudioBackend audio_;
  PlatformCapabilities caps_;
  std::shared_ptr<FakeEncoderState> enc_;
  std::unique_ptr<RecordingSessionManager> session_;
};

TEST_F(RecordingSessionTest, VideoOnlyRecording) {
  ASSERT_EQ(session_->Start(Request()), kSnapReelOk);
  EXPECT_EQ(session_->state(), SessionState::kRecording);
  EXPECT_EQ(capture_.last_opened_source, "screen:0");
  EXPECT_EQ(enc_->config.width, 100);
  EXPECT_EQ(enc_->config.height, 60);
  EXPECT_EQ(enc_->config.fps, 30);
  EXPECT_FALSE(enc_->config.has_audio);
  EXPECT_FALSE(session_->has_audio());

  TickFrames(3);
  SessionResult result;
  ASSERT_TRUE(session_->Stop(&result));
  EXPECT_EQ(result.error, kSnapReelOk);
  EXPECT_EQ(result.frame_count, 3);
  EXPECT_EQ(result.extension, "webm");
  EXPECT_EQ(result.data, (std::vector<uint8_t>{0xDF, 0xA3, 0x01, 0x02}));
  EXPECT_EQ(session_->state(), SessionState::kIdle);
  EXPECT_TRUE(capture_.video_state->stopped.load());
  EXPECT_FALSE(enc_->frame_after_stop);
}

TEST_F(RecordingSessionTest, ChunksAreConcatenatedInOrder) {
  enc_->emit_per_frame = true;
  ASSERT_EQ(session_->Start(Request()), kSnapReelOk);
  TickFrames(2);
  EXPECT_EQ(session_->chunk_count(), 2u);
  SessionResult result;
  ASSERT_TRUE(session_->Stop(&result));
  EXPECT_EQ(result.chunk_count, 3u);
  EXPECT_EQ(result.data, (std::vector<uint8_t>{0x1A, 0x45, 0x1A, 0x45, 0xDF,
                                               0xA3, 0x01, 0x02}));
}

TEST_F(RecordingSessionTest, UnsupportedFrameRateFallsBack) {
  RecordingRequest req = Request();
  req.settings.frame_rate = 25;
  ASSERT_EQ(session_->Start(req), kSnapReelOk);
  EXPECT_EQ(enc_->config.fps, 30);
}

TEST_F(RecordingSessionTest, MicrophoneAttachesDirectly) {
  ASSERT_EQ(session_->Start(Request(kSnapReelAudioMicrophone)), kSnapReelOk);
  EXPECT_EQ(audio_.mic_opens, 1);
  EXPECT_EQ(audio_.system_opens, 0);
  EXPECT_TRUE(session_->has_audio());
  EXPECT_TRUE(enc_->config.has_audio);
  EXPECT_EQ(enc_->config.audio_sample_rate, 44100);
  EXPECT_EQ(enc_->config.audio_channels, 2);

  TickFrames(1);
  EXPECT_EQ(enc_->audio_blocks, 1);
  SessionResult result;
  ASSERT_TRUE(session_->Stop(&result));
  EXPECT_TRUE(result.has_audio);
}

TEST_F(RecordingSessionTest, SystemAudioGoesThroughGraph) {
  ASSERT_EQ(session_->Start(Request(kSnapReelAudioSystem)), kSnapReelOk);
  EXPECT_EQ(audio_.system_opens, 1);
  EXPECT_TRUE(session_->has_audio());
  TickFrames(1);
  EXPECT_EQ(enc_->audio_blocks, 1);
  SessionResult result;
  ASSERT_TRUE(session_->Stop(&result));
  EXPECT_TRUE(result.has_audio);
}

TEST_F(RecordingSessionTest, PausedSourceKeepsAudioFlowing) {
  ASSERT_EQ(session_->Start(Request(kSnapReelAudioMicrophone)), kSnapReelOk);
  capture_.video_state->paused = true;
  EXPECT_EQ(session_->compositor()->Tick(),
            FrameCompositor::TickResult::kSkipped);
  EXPECT_EQ(enc_->audio_blocks, 1);
  audio_.last_track->Push(std::vector<int16_t>(882, 200));
  EXPECT_EQ(session_->compositor()->Tick(),
            FrameCompositor::TickResult::kSkipped);
  EXPECT_EQ(enc_->audio_blocks, 2);

  capture_.video_state->paused = false;
  TickFrames(1);
  ASSERT_EQ(enc_->timestamps.size(), 1u);
  EXPECT_EQ(enc_->timestamps[0], 66666666);
  SessionResult result;
  ASSERT_TRUE(session_->Stop(&result));
  EXPECT_EQ(result.frame_count, 1);
}

TEST_F(RecordingSessionTest, AudioFailureDegradesToVideoOnly) {
  audio_.mic_error = kSnapReelErrorPermissionDenied;
  ASSERT_EQ(session_->Start(Request(kSnapReelAudioMicrophone)), kSnapReelOk);
  EXPECT_FALSE(session_->has_audio());
  EXPECT_FALSE(enc_->config.has_audio);
  TickFrames(1);
  SessionResult result;
  ASSERT_TRUE(session_->Stop(&result));
  EXPECT_EQ(result.error, kSnapReelOk);
  EXPECT_FALSE(result.has_audio);
}

TEST_F(RecordingSessionTest, UnsupportedAudioSourceIsNotOpened) {
  audio_.supported.clear();
  ASSERT_EQ(session_->Start(Request(kSnapReelAudioSystem)), kSnapReelOk);
  EXPECT_EQ(audio_.system_opens, 0);
  EXPECT_FALSE(session_->has_audio());
}

TEST_F(RecordingSessionTest, NoLoopbackCapabilitySkipsSystemAudio) {
  caps_.system_audio_loopback = false;
  RecordingSessionManager::Options opts;
  opts.run_compositor_loop = false;
  RecordingSessionManager session(&capture_, &audio_, MakeEncoderFactory(enc_),
                                  caps_, opts);
  ASSERT_EQ(session.Start(Request(kSnapReelAudioSystem)), kSnapReelOk);
  EXPECT_EQ(audio_.system_opens, 0);
  EXPECT_FALSE(session.has_audio());
}

TEST_F(RecordingSessionTest, NullAudioBackendDegrades) {
  RecordingSessionManager::Options opts;
  opts.run_compositor_loop = false;
  RecordingSessionManager session(&capture_, nullptr, MakeEncoderFactory(enc_),
                                  caps_, opts);
  ASSERT_EQ(session.Start(Request(kSnapReelAudioMicrophone)), kSnapReelOk);
  EXPECT_FALSE(session.has_audio());
}

TEST_F(RecordingSessionTest, NoScreenSourceFails) {
  capture_.ClearSources();
  EXPECT_EQ(session_->Start(Request()), kSnapReelErrorNoCaptureSource);
  EXPECT_EQ(session_->state(), SessionState::kIdle);
  EXPECT_EQ(enc_->created, 0);
}

TEST_F(RecordingSessionTest, VideoTrackFailure) {
  capture_.fail_video = true;
  EXPECT_EQ(session_->Start(Request()), kSnapReelErrorAcquisitionFailed);
  EXPECT_EQ(session_->state(), SessionState::kIdle);
}

TEST_F(RecordingSessionTest, TinySelectionFails) {
  RecordingRequest req = Request();
  req.rect = SelectionRect{0, 0, 1, 1};
  EXPECT_EQ(session_->Start(req), kSnapReelErrorInvalidParam);
  EXPECT_TRUE(capture_.video_state->stopped.load());
}

TEST_F(RecordingSessionTest, EncoderInitFailureReleasesSources) {
  enc_->fail_initialize = true;
  EXPECT_EQ(session_->Start(Request(kSnapReelAudioMicrophone)),
            kSnapReelErrorEncodingFailed);
  EXPECT_EQ(session_->state(), SessionState::kIdle);
  EXPECT_TRUE(capture_.video_state->stopped.load());
  EXPECT_FALSE(session_->has_audio());
}

TEST_F(RecordingSessionTest, StopWithoutSessionIsRejected) {
  SessionResult result;
  EXPECT_FALSE(session_->Stop(&result));
}

TEST_F(RecordingSessionTest, EmptyOutputIsReported) {
  enc_->emit_nothing = true;
  ASSERT_EQ(session_->Start(Request()), kSnapReelOk);
  TickFrames(1);
  SessionResult result;
  ASSERT_TRUE(session_->Stop(&result));
  EXPECT_EQ(result.error, kSnapReelErrorEmptyOutput);
  EXPECT_TRUE(result.data.empty());
}

TEST_F(RecordingSessionTest, EncoderStopFailureBeatsEmptyOutput) {
  enc_->emit_nothing = true;
  enc_->fail_stop = true;
  ASSERT_EQ(session_->Start(Request()), kSnapReelOk);
  SessionResult result;
  ASSERT_TRUE(session_->Stop(&result));
  EXPECT_EQ(result.error, kSnapReelErrorEncodingFailed);
}

TEST_F(RecordingSessionTest, SecondStartDiscardsFirst) {
  enc_->emit_per_frame = true;
  ASSERT_EQ(session_->Start(Request()), kSnapReelOk);
  TickFrames(2);
  auto first_video = capture_.video_state;
  ASSERT_EQ(session_->Start(Request()), kSnapReelOk);
  EXPECT_TRUE(first_video->stopped.load());
  EXPECT_EQ(enc_->created, 2);
  EXPECT_EQ(session_->chunk_count(), 0u);
  SessionResult result;
  ASSERT_TRUE(session_->Stop(&result));
  EXPECT_EQ(result.frame_count, 0);
  EXPECT_EQ(result.data, (std::vector<uint8_t>{0xDF, 0xA3, 0x01, 0x02}));
}

TEST_F(RecordingSessionTest, AbortProducesNothing) {
  ASSERT_EQ(session_->Start(Request()), kSnapReelOk);
  session_->Abort();
  EXPECT_EQ(session_->state(), SessionState::kIdle);
  EXPECT_TRUE(capture_.video_state->stopped.load());
  SessionResult result;
  EXPECT_FALSE(session_->Stop(&result));
  session_->Abort();
}

// Runs the real compositor loop; an encoder write failure faults the session.
TEST(RecordingSessionLoopTest, WriteFaultIsReportedAndWins) {
  FakeCaptureBackend capture;
  auto enc = std::make_shared<FakeEncoderState>();
  enc->fail_write = true;
  RecordingSessionManager session(&capture, nullptr, MakeEncoderFactory(enc),
                                  PlatformCapabilities());
  std::atomic<int> faults{0};
  session.SetFaultCallback([&](SnapReelError err) {
    EXPECT_EQ(err, kSnapReelErrorEncodingFailed);
    ++faults;
  });

  RecordingRequest req;
  req.rect = SelectionRect{0, 0, 64, 64};
  req.settings = DefaultAppSettings();
  req.settings.audio_source = kSnapReelAudioNone;
  ASSERT_EQ(session.Start(req), kSnapReelOk);

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (faults.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_EQ(faults.load(), 1);

  SessionResult result;
  ASSERT_TRUE(session.Stop(&result));
  // The final chunk exists, but the fault takes priority.
  EXPECT_FALSE(result.data.empty());
  EXPECT_EQ(result.error, kSnapReelErrorEncodingFailed);
}

TEST(RecordingSessionLoopTest, ThrowingSourceBecomesFault) {
  FakeCaptureBackend capture;
  auto enc = std::make_shared<FakeEncoderState>();
  RecordingSessionManager session(&capture, nullptr, MakeEncoderFactory(enc),
                                  PlatformCapabilities());
  std::atomic<int> faults{0};
  std::atomic<SnapReelError> fault_error{kSnapReelOk};
  session.SetFaultCallback([&](SnapReelError err) {
    fault_error = err;
    ++faults;
  });

  RecordingRequest req;
  req.rect = SelectionRect{0, 0, 64, 64};
  req.settings = DefaultAppSettings();
  req.settings.audio_source = kSnapReelAudioNone;
  ASSERT_EQ(session.Start(req), kSnapReelOk);
  capture.video_state->throw_on_read = true;

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (faults.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  ASSERT_EQ(faults.load(), 1);
  EXPECT_EQ(fault_error.load(), kSnapReelErrorUnknown);

  SessionResult result;
  ASSERT_TRUE(session.Stop(&result));
  EXPECT_EQ(result.error, kSnapReelErrorUnknown);
  EXPECT_EQ(session.state(), SessionState::kIdle);
}

TEST(SessionStateNameTest, Names) {
  EXPECT_STREQ(SessionStateName(SessionState::kIdle), "idle");
  EXPECT_STREQ(SessionStateName(SessionState::kStopping), "stopping");
}
