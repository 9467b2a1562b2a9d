// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_MEDIA_TRACK_H_
#define SNAPREEL_CORE_MEDIA_TRACK_H_

#include <cstdint>
#include <memory>
#include <vector>

#include "core/image.h"

namespace snapreel {
namespace internal {

/// Audio samples buffer (interleaved S16LE PCM).
struct AudioSamples {
  std::vector<int16_t> data;
  int sample_rate = 44100;
  int channels = 2;
  int64_t timestamp_ns = 0;  // Presentation timestamp in nanoseconds
};

/// Live desktop video stream.
class VideoTrack {
 public:
  virtual ~VideoTrack() = default;

  // Non-copyable.
  VideoTrack(const VideoTrack&) = delete;
  VideoTrack& operator=(const VideoTrack&) = delete;

  /// False once the track has ended (stopped or source lost).
  virtual bool IsLive() const = 0;

  /// A paused track produces no frames but is still live.
  virtual bool IsPaused() const = 0;

  /// Latest frame at the display's physical resolution, or nullptr.
  virtual std::unique_ptr<Image> ReadFrame() = 0;

  /// End the track and release the source. Idempotent.
  virtual void Stop() = 0;

 protected:
  VideoTrack() = default;
};

/// Live audio stream (microphone, loopback or a mix).
class AudioTrack {
 public:
  virtual ~AudioTrack() = default;

  // Non-copyable.
  AudioTrack(const AudioTrack&) = delete;
  AudioTrack& operator=(const AudioTrack&) = delete;

  virtual bool IsLive() const = 0;

  /// Samples captured since the last call. May be empty.
  virtual AudioSamples ReadSamples() = 0;

  virtual int GetSampleRate() const = 0;
  virtual int GetChannels() const = 0;

  /// End the track. Idempotent.
  virtual void Stop() = 0;

 protected:
  AudioTrack() = default;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_MEDIA_TRACK_H_
