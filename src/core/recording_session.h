// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_RECORDING_SESSION_H_
#define SNAPREEL_CORE_RECORDING_SESSION_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/app_settings.h"
#include "core/audio_backend.h"
#include "core/audio_graph.h"
#include "core/capture_backend.h"
#include "core/encoder_backend.h"
#include "core/frame_compositor.h"
#include "core/geometry.h"
#include "core/platform_services.h"
#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

enum class SessionState {
  kIdle,
  kStarting,
  kRecording,
  kStopping,
};

const char* SessionStateName(SessionState state);

/// What to record.
struct RecordingRequest {
  SelectionRect rect;       // Logical pixels with scale_factor attached
  AppSettings settings;
  std::string source_id;    // Empty = first enumerated screen
};

/// Terminal outcome of one session.
struct SessionResult {
  SnapReelError error = kSnapReelOk;
  std::vector<uint8_t> data;
  std::string extension;    // Container extension, e.g. "webm"
  int64_t frame_count = 0;
  size_t chunk_count = 0;
  bool has_audio = false;
};

using EncoderFactory = std::function<std::unique_ptr<EncoderBackend>()>;

/// Acquires sources, runs the compositor into the encoder, and assembles the
/// encoded chunks into one buffer.
///
/// Start() and Stop() must be called from a single thread (the recorder
/// worker). Chunks arrive on encoder threads.
class RecordingSessionManager {
 public:
  /// Called on the compositor thread when the session faults mid-recording.
  /// The owner is expected to schedule Stop() on its own thread.
  using FaultCallback = std::function<void(SnapReelError error)>;

  struct Options {
    /// When false the compositor loop is not started; drive ticks through
    /// compositor()->Tick() instead.
    bool run_compositor_loop = true;
  };

  /// Backends are not owned and must outlive the manager. |audio| may be
  /// null (audio requests then degrade to video-only).
  RecordingSessionManager(CaptureBackend* capture, AudioBackend* audio,
                          EncoderFactory encoder_factory,
                          const PlatformCapabilities& caps);
  RecordingSessionManager(CaptureBackend* capture, AudioBackend* audio,
                          EncoderFactory encoder_factory,
                          const PlatformCapabilities& caps,
                          const Options& options);
  ~RecordingSessionManager();

  RecordingSessionManager(const RecordingSessionManager&) = delete;
  RecordingSessionManager& operator=(const RecordingSessionManager&) = delete;

  /// Tear down any previous session (its output is discarded), acquire
  /// sources and start encoding.
  /// @return kSnapReelOk, or the fatal error after tearing down.
  SnapReelError Start(const RecordingRequest& request);

  /// Finalize the running session into |out_result|.
  /// @return false (and logs a warning) if no session is running.
  bool Stop(SessionResult* out_result);

  /// Release everything without producing a result. Idempotent.
  void Abort();

  void SetFaultCallback(FaultCallback callback) {
    fault_callback_ = std::move(callback);
  }

  SessionState state() const;
  bool has_audio() const { return attached_audio_ != nullptr; }
  size_t chunk_count() const;
  FrameCompositor* compositor() { return &compositor_; }

 private:
  void Teardown();
  void OnChunk(std::vector<uint8_t> chunk);
  void OnFault(SnapReelError error);
  void PumpAudio();
  void AcquireAudio(const RecordingRequest& request);
  void SetState(SessionState state);

  CaptureBackend* capture_;
  AudioBackend* audio_;
  EncoderFactory encoder_factory_;
  PlatformCapabilities caps_;
  Options options_;
  FaultCallback fault_callback_;

  mutable std::mutex state_mutex_;
  SessionState state_ = SessionState::kIdle;
  SnapReelError fault_ = kSnapReelOk;

  // Session members.
  std::unique_ptr<VideoTrack> video_track_;
  std::unique_ptr<AudioTrack> mic_track_;
  std::unique_ptr<AudioTrack> system_track_;
  std::unique_ptr<AudioGraph> audio_graph_;
  AudioTrack* attached_audio_ = nullptr;  // mic_track_ or graph destination
  std::unique_ptr<EncoderBackend> encoder_;
  FrameCompositor compositor_;

  mutable std::mutex chunk_mutex_;
  std::vector<std::vector<uint8_t>> chunks_;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_RECORDING_SESSION_H_
