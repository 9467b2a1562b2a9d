// Copyright 2026 The snapreel Authors

#include "core/recording_session.h"

#include <utility>

#include "core/logger.h"

namespace snapreel {
namespace internal {

namespace {

constexpr int kDefaultFps = 30;
constexpr int kVideoBitrate = 2500000;  // 2.5 Mbps

}  // namespace

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kIdle:      return "idle";
    case SessionState::kStarting:  return "starting";
    case SessionState::kRecording: return "recording";
    case SessionState::kStopping:  return "stopping";
  }
  return "unknown";
}

RecordingSessionManager::RecordingSessionManager(
    CaptureBackend* capture, AudioBackend* audio,
    EncoderFactory encoder_factory, const PlatformCapabilities& caps)
    : RecordingSessionManager(capture, audio, std::move(encoder_factory), caps,
                              Options()) {}

RecordingSessionManager::RecordingSessionManager(
    CaptureBackend* capture, AudioBackend* audio,
    EncoderFactory encoder_factory, const PlatformCapabilities& caps,
    const Options& options)
    : capture_(capture),
      audio_(audio),
      encoder_factory_(std::move(encoder_factory)),
      caps_(caps),
      options_(options) {}

RecordingSessionManager::~RecordingSessionManager() { Teardown(); }

SessionState RecordingSessionManager::state() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

void RecordingSessionManager::SetState(SessionState state) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (state_ != state) {
    SNAPREEL_LOG_DEBUG("Session: {} -> {}", SessionStateName(state_),
                       SessionStateName(state));
  }
  state_ = state;
}

size_t RecordingSessionManager::chunk_count() const {
  std::lock_guard<std::mutex> lock(chunk_mutex_);
  return chunks_.size();
}

// ---------------------------------------------------------------------------
// Start
// ---------------------------------------------------------------------------

SnapReelError RecordingSessionManager::Start(const RecordingRequest& request) {
  if (state() != SessionState::kIdle) {
    SNAPREEL_LOG_WARN("Session: discarding previous session ({})",
                      SessionStateName(state()));
  }
  Teardown();
  SetState(SessionState::kStarting);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    fault_ = kSnapReelOk;
  }

  auto fail = [this](SnapReelError error, const char* what) {
    SNAPREEL_LOG_ERROR("Session start failed: {} ({})", what,
                       snapreel_error_string(error));
    Teardown();
    return error;
  };

  if (!capture_) return fail(kSnapReelErrorNotInitialized, "no capture backend");

  std::string source_id = request.source_id;
  if (source_id.empty()) {
    auto sources = capture_->ListScreenSources();
    if (sources.empty()) {
      return fail(kSnapReelErrorNoCaptureSource, "no screen sources");
    }
    source_id = sources.front().id;
  }

  video_track_ = capture_->OpenVideoTrack(source_id);
  if (!video_track_) {
    return fail(kSnapReelErrorAcquisitionFailed, "video track unavailable");
  }

  int fps = request.settings.frame_rate;
  if (!IsSupportedFrameRate(fps)) {
    SNAPREEL_LOG_WARN("Session: unsupported frame rate {}, using {}", fps,
                      kDefaultFps);
    fps = kDefaultFps;
  }

  bool configured = compositor_.Configure(
      video_track_.get(), request.rect, fps,
      [this](const Image& frame, int64_t timestamp_ns) {
        return encoder_ && encoder_->WriteVideoFrame(frame, timestamp_ns);
      });
  if (!configured) return fail(kSnapReelErrorInvalidParam, "selection too small");
  compositor_.SetTickHook([this]() { PumpAudio(); });
  compositor_.SetFaultHook([this](SnapReelError error) { OnFault(error); });

  AcquireAudio(request);

  encoder_ = encoder_factory_ ? encoder_factory_() : nullptr;
  if (!encoder_) return fail(kSnapReelErrorEncodingFailed, "no encoder");

  EncoderConfig config;
  config.width = compositor_.dest_width();
  config.height = compositor_.dest_height();
  config.fps = fps;
  config.video_bitrate = kVideoBitrate;
  config.has_audio = attached_audio_ != nullptr;
  if (attached_audio_) {
    config.audio_sample_rate = attached_audio_->GetSampleRate();
    config.audio_channels = attached_audio_->GetChannels();
  }
  if (!encoder_->Initialize(config, [this](std::vector<uint8_t> chunk) {
        OnChunk(std::move(chunk));
      })) {
    return fail(kSnapReelErrorEncodingFailed, "encoder initialize");
  }
  if (!encoder_->Start()) {
    return fail(kSnapReelErrorEncodingFailed, "encoder start");
  }
  if (options_.run_compositor_loop && !compositor_.Start()) {
    return fail(kSnapReelErrorEncodingFailed, "compositor start");
  }

  SetState(SessionState::kRecording);
  SNAPREEL_LOG_INFO("Session recording: {}x{} @{}fps, audio={}",
                    config.width, config.height, fps,
                    AudioSourceName(config.has_audio
                                        ? request.settings.audio_source
                                        : kSnapReelAudioNone));
  return kSnapReelOk;
}

void RecordingSessionManager::AcquireAudio(const RecordingRequest& request) {
  SnapReelAudioSource source = request.settings.audio_source;
  if (source == kSnapReelAudioNone) return;

  if (!audio_ || !audio_->IsSupported(source)) {
    SNAPREEL_LOG_WARN("Audio source '{}' not supported, recording video only",
                      AudioSourceName(source));
    return;
  }

  if (source == kSnapReelAudioMicrophone) {
    if (caps_.microphone_consent_required) {
      SNAPREEL_LOG_INFO("Requesting microphone access");
    }
    SnapReelError err = audio_->OpenMicrophone(&mic_track_);
    if (err != kSnapReelOk || !mic_track_) {
      SNAPREEL_LOG_WARN("Microphone unavailable ({}), recording video only",
                        snapreel_error_string(err));
      mic_track_.reset();
      return;
    }
    // The microphone is attached to the encoder directly.
    attached_audio_ = mic_track_.get();
    return;
  }

  if (!caps_.system_audio_loopback) {
    SNAPREEL_LOG_WARN("System audio loopback not available, recording video only");
    return;
  }
  SnapReelError err = audio_->OpenSystemAudio(&system_track_);
  if (err != kSnapReelOk || !system_track_) {
    SNAPREEL_LOG_WARN("System audio unavailable ({}), recording video only",
                      snapreel_error_string(err));
    system_track_.reset();
    return;
  }
  // System audio only reaches the encoder through the graph destination.
  audio_graph_ = std::make_unique<AudioGraph>();
  if (!audio_graph_->Connect(system_track_.get())) {
    SNAPREEL_LOG_WARN("System audio could not be routed, recording video only");
    audio_graph_.reset();
    system_track_->Stop();
    system_track_.reset();
    return;
  }
  attached_audio_ = audio_graph_->destination();
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

void RecordingSessionManager::OnChunk(std::vector<uint8_t> chunk) {
  if (chunk.empty()) {
    SNAPREEL_LOG_WARN("Encoder delivered an empty chunk");
    return;
  }
  std::lock_guard<std::mutex> lock(chunk_mutex_);
  chunks_.push_back(std::move(chunk));
}

void RecordingSessionManager::PumpAudio() {
  if (!attached_audio_ || !encoder_) return;
  AudioSamples samples = attached_audio_->ReadSamples();
  if (samples.data.empty()) return;
  if (!encoder_->WriteAudio(samples)) {
    SNAPREEL_LOG_DEBUG("Encoder dropped {} audio samples", samples.data.size());
  }
}

void RecordingSessionManager::OnFault(SnapReelError error) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (fault_ == kSnapReelOk) fault_ = error;
  }
  SNAPREEL_LOG_ERROR("Session fault: {}", snapreel_error_string(error));
  if (fault_callback_) fault_callback_(error);
}

// ---------------------------------------------------------------------------
// Stop / teardown
// ---------------------------------------------------------------------------

bool RecordingSessionManager::Stop(SessionResult* out_result) {
  if (state() != SessionState::kRecording) {
    SNAPREEL_LOG_WARN("Session stop ignored: {}", SessionStateName(state()));
    return false;
  }
  SetState(SessionState::kStopping);

  // Order matters: no frame may reach the encoder after it finalizes, and
  // the last chunk must be collected before the buffer is assembled.
  compositor_.Stop();
  bool encoder_ok = encoder_->Stop();
  compositor_.Detach();
  if (video_track_) video_track_->Stop();
  if (mic_track_) mic_track_->Stop();
  if (system_track_) system_track_->Stop();
  if (audio_graph_) audio_graph_->Close();

  SessionResult result;
  result.extension = encoder_->container_extension();
  result.frame_count = compositor_.frames_drawn();
  result.has_audio = attached_audio_ != nullptr;
  {
    std::lock_guard<std::mutex> lock(chunk_mutex_);
    result.chunk_count = chunks_.size();
    size_t total = 0;
    for (const auto& c : chunks_) total += c.size();
    result.data.reserve(total);
    for (const auto& c : chunks_) {
      result.data.insert(result.data.end(), c.begin(), c.end());
    }
    chunks_.clear();
  }

  SnapReelError fault;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    fault = fault_;
  }
  if (fault != kSnapReelOk) {
    result.error = fault;
  } else if (!encoder_ok) {
    result.error = kSnapReelErrorEncodingFailed;
  } else if (result.data.empty()) {
    result.error = kSnapReelErrorEmptyOutput;
  }

  SNAPREEL_LOG_INFO("Session finished: {} bytes in {} chunks, {} frames ({})",
                    result.data.size(), result.chunk_count, result.frame_count,
                    snapreel_error_string(result.error));

  Teardown();
  if (out_result) *out_result = std::move(result);
  return true;
}

void RecordingSessionManager::Abort() {
  if (state() != SessionState::kIdle) {
    SNAPREEL_LOG_WARN("Session aborted");
  }
  Teardown();
}

void RecordingSessionManager::Teardown() {
  compositor_.Stop();
  if (encoder_) encoder_->Stop();
  compositor_.Detach();
  if (video_track_) video_track_->Stop();
  if (mic_track_) mic_track_->Stop();
  if (system_track_) system_track_->Stop();
  if (audio_graph_) audio_graph_->Close();

  attached_audio_ = nullptr;
  encoder_.reset();
  audio_graph_.reset();
  system_track_.reset();
  mic_track_.reset();
  video_track_.reset();
  {
    std::lock_guard<std::mutex> lock(chunk_mutex_);
    chunks_.clear();
  }
  SetState(SessionState::kIdle);
}

}  // namespace internal
}  // namespace snapreel
