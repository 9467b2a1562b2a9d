// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_ENCODER_BACKEND_H_
#define SNAPREEL_CORE_ENCODER_BACKEND_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "core/image.h"
#include "core/media_track.h"

namespace snapreel {
namespace internal {

/// Encoder parameters for one recording session.
struct EncoderConfig {
  int width = 0;            // Must be even
  int height = 0;           // Must be even
  int fps = 30;
  int video_bitrate = 2500000;  // 2.5 Mbps
  bool has_audio = false;
  int audio_sample_rate = 44100;
  int audio_channels = 2;
};

/// Receives encoded container bytes in output order. May be invoked from an
/// encoder-owned thread.
using ChunkCallback = std::function<void(std::vector<uint8_t> chunk)>;

/// Abstract streaming encoder/muxer producing a single container.
///
/// Linux: GStreamer appsrc -> vp8enc/vorbisenc -> webmmux -> appsink
class EncoderBackend {
 public:
  virtual ~EncoderBackend() = default;

  // Non-copyable.
  EncoderBackend(const EncoderBackend&) = delete;
  EncoderBackend& operator=(const EncoderBackend&) = delete;

  /// Build the pipeline. @return true on success.
  virtual bool Initialize(const EncoderConfig& config,
                          ChunkCallback on_chunk) = 0;

  virtual bool Start() = 0;

  /// Encode one BGRA8 frame with the config's dimensions.
  virtual bool WriteVideoFrame(const Image& frame, int64_t timestamp_ns) = 0;

  /// Encode interleaved PCM. Ignored when the config has no audio.
  virtual bool WriteAudio(const AudioSamples& samples) = 0;

  /// Flush and finalize the container. Every chunk has been delivered to the
  /// callback when this returns. Idempotent.
  virtual bool Stop() = 0;

  /// File extension of the produced container, without the dot.
  virtual const char* container_extension() const = 0;

 protected:
  EncoderBackend() = default;
};

/// Factory function implemented per-platform.
std::unique_ptr<EncoderBackend> CreatePlatformEncoder();

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_ENCODER_BACKEND_H_
