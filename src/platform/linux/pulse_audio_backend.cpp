// Copyright 2026 The snapreel Authors
// Linux audio backend, PulseAudio Simple API implementation.

#include "platform/linux/pulse_audio_backend.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <pulse/error.h>
#include <pulse/simple.h>

#include "core/logger.h"

namespace snapreel {
namespace internal {

namespace {

constexpr int kSampleRate = 44100;
constexpr int kChannels = 2;
constexpr char kMonitorDevice[] = "@DEFAULT_MONITOR@";
// Unread audio kept between reads; older samples are dropped.
constexpr size_t kMaxPendingFrames = kSampleRate * 2;

pa_sample_spec MakeSpec() {
  pa_sample_spec spec = {};
  spec.format = PA_SAMPLE_S16LE;
  spec.rate = kSampleRate;
  spec.channels = kChannels;
  return spec;
}

// ---------------------------------------------------------------------------
// PulseAudioTrack
// ---------------------------------------------------------------------------

/// One pa_simple record stream drained by a background thread.
class PulseAudioTrack : public AudioTrack {
 public:
  explicit PulseAudioTrack(pa_simple* stream)
      : stream_(stream), start_(std::chrono::steady_clock::now()) {
    capturing_.store(true, std::memory_order_release);
    capture_thread_ = std::thread(&PulseAudioTrack::CaptureLoop, this);
  }

  ~PulseAudioTrack() override { Stop(); }

  bool IsLive() const override {
    return capturing_.load(std::memory_order_acquire);
  }

  AudioSamples ReadSamples() override {
    AudioSamples samples;
    samples.sample_rate = kSampleRate;
    samples.channels = kChannels;

    std::lock_guard<std::mutex> lock(buffer_mutex_);
    samples.data = std::move(pending_samples_);
    samples.timestamp_ns = pending_timestamp_ns_;
    pending_samples_.clear();
    return samples;
  }

  int GetSampleRate() const override { return kSampleRate; }
  int GetChannels() const override { return kChannels; }

  void Stop() override {
    capturing_.store(false, std::memory_order_release);
    if (capture_thread_.joinable()) capture_thread_.join();
    if (stream_) {
      pa_simple_free(stream_);
      stream_ = nullptr;
    }
  }

 private:
  /// Background thread that reads from PulseAudio.
  void CaptureLoop() {
    // Read buffer: 10ms of audio at a time.
    const int frames_per_read = kSampleRate / 100;
    std::vector<int16_t> read_buf(static_cast<size_t>(frames_per_read) *
                                  kChannels);

    while (capturing_.load(std::memory_order_acquire)) {
      int error = 0;
      int ret = pa_simple_read(stream_, read_buf.data(),
                               read_buf.size() * sizeof(int16_t), &error);
      if (ret < 0) {
        SNAPREEL_LOG_ERROR("pa_simple_read failed: {}", pa_strerror(error));
        capturing_.store(false, std::memory_order_release);
        break;
      }

      std::lock_guard<std::mutex> lock(buffer_mutex_);
      if (pending_samples_.empty()) {
        pending_timestamp_ns_ =
            std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - start_)
                .count();
      }
      pending_samples_.insert(pending_samples_.end(), read_buf.begin(),
                              read_buf.end());
      const size_t max_samples = kMaxPendingFrames * kChannels;
      if (pending_samples_.size() > max_samples) {
        size_t excess = pending_samples_.size() - max_samples;
        pending_samples_.erase(pending_samples_.begin(),
                               pending_samples_.begin() + excess);
        pending_timestamp_ns_ += static_cast<int64_t>(excess / kChannels) *
                                 1000000000LL / kSampleRate;
        ++dropped_reads_;
        if (dropped_reads_ == 1) {
          SNAPREEL_LOG_WARN("Audio reader is behind, dropping oldest samples");
        }
      }
    }
  }

  pa_simple* stream_;
  std::chrono::steady_clock::time_point start_;
  std::atomic<bool> capturing_{false};
  std::thread capture_thread_;

  std::mutex buffer_mutex_;
  std::vector<int16_t> pending_samples_;
  int64_t pending_timestamp_ns_ = 0;
  int64_t dropped_reads_ = 0;
};

}  // namespace

bool PulseAudioBackend::IsSupported(SnapReelAudioSource source) const {
  return source == kSnapReelAudioMicrophone || source == kSnapReelAudioSystem;
}

SnapReelError PulseAudioBackend::OpenMicrophone(
    std::unique_ptr<AudioTrack>* out_track) {
  return Open(nullptr, "microphone", out_track);
}

SnapReelError PulseAudioBackend::OpenSystemAudio(
    std::unique_ptr<AudioTrack>* out_track) {
  return Open(kMonitorDevice, "system_audio", out_track);
}

SnapReelError PulseAudioBackend::Open(const char* device,
                                      const char* stream_name,
                                      std::unique_ptr<AudioTrack>* out_track) {
  if (!out_track) return kSnapReelErrorInvalidParam;

  pa_sample_spec spec = MakeSpec();
  int error = 0;
  pa_simple* stream = pa_simple_new(
      nullptr,            // default server
      "snapreel",         // application name
      PA_STREAM_RECORD,   // direction
      device,             // nullptr = default source (microphone)
      stream_name,
      &spec,
      nullptr,            // default channel map
      nullptr,            // default buffer attributes
      &error);
  if (!stream) {
    SNAPREEL_LOG_WARN("PulseAudio '{}' unavailable: {}",
                      device ? device : "default", pa_strerror(error));
    return error == PA_ERR_ACCESS ? kSnapReelErrorPermissionDenied
                                  : kSnapReelErrorAcquisitionFailed;
  }

  SNAPREEL_LOG_INFO("PulseAudio capture opened: {}Hz, {}ch, device={}",
                    kSampleRate, kChannels, device ? device : "default");
  *out_track = std::make_unique<PulseAudioTrack>(stream);
  return kSnapReelOk;
}

std::unique_ptr<AudioBackend> CreatePlatformAudioBackend() {
  return std::make_unique<PulseAudioBackend>();
}

}  // namespace internal
}  // namespace snapreel
