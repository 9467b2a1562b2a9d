// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_PLATFORM_LINUX_GST_ENCODER_BACKEND_H_
#define SNAPREEL_PLATFORM_LINUX_GST_ENCODER_BACKEND_H_

#include <atomic>
#include <cstdint>
#include <mutex>

#include <gst/gst.h>

#include "core/encoder_backend.h"

namespace snapreel {
namespace internal {

/// GStreamer WebM encoder.
///
///   appsrc(BGRA)  -> videoconvert -> vp8enc    -> webmmux -> appsink
///   appsrc(S16LE) -> audioconvert -> vorbisenc -> webmmux
///
/// Muxed bytes are pulled from the appsink on the streaming thread and
/// handed to the chunk callback.
class GstEncoderBackend : public EncoderBackend {
 public:
  GstEncoderBackend() = default;
  ~GstEncoderBackend() override;

  bool Initialize(const EncoderConfig& config,
                  ChunkCallback on_chunk) override;
  bool Start() override;
  bool WriteVideoFrame(const Image& frame, int64_t timestamp_ns) override;
  bool WriteAudio(const AudioSamples& samples) override;
  bool Stop() override;
  const char* container_extension() const override { return "webm"; }

 private:
  enum class State { kIdle, kReady, kRunning, kStopped };

  static GstFlowReturn OnNewSample(GstElement* sink, gpointer user_data);
  void DeliverSample(GstSample* sample);
  void CleanupPipeline();

  EncoderConfig config_;
  ChunkCallback on_chunk_;

  GstElement* pipeline_ = nullptr;
  GstElement* video_src_ = nullptr;
  GstElement* audio_src_ = nullptr;
  GstElement* sink_ = nullptr;

  std::mutex write_mutex_;
  State state_ = State::kIdle;
  GstClockTime frame_duration_ns_ = 0;
  uint64_t audio_frames_written_ = 0;
  int64_t audio_origin_ns_ = -1;  // Track timestamp of the first block
  std::atomic<uint64_t> bytes_out_{0};
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_PLATFORM_LINUX_GST_ENCODER_BACKEND_H_
