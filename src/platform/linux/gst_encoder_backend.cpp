// Copyright 2026 The snapreel Authors
// Linux encoder backend, GStreamer appsrc/appsink WebM pipeline.

#include "platform/linux/gst_encoder_backend.h"

#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <gst/app/gstappsink.h>
#include <gst/app/gstappsrc.h>

#include "core/logger.h"

namespace snapreel {
namespace internal {

namespace {

// Seconds to wait for EOS to drain through the muxer.
constexpr int kEosTimeoutSec = 5;

std::string BuildPipelineDescription(const EncoderConfig& config) {
  std::string desc =
      "appsrc name=videosrc is-live=true format=time "
      "caps=video/x-raw,format=BGRA"
      ",width=" + std::to_string(config.width) +
      ",height=" + std::to_string(config.height) +
      ",framerate=" + std::to_string(config.fps) + "/1 "
      "! queue "
      "! videoconvert "
      "! vp8enc deadline=1 cpu-used=8 target-bitrate=" +
      std::to_string(config.video_bitrate) +
      " ! queue "
      "! webmmux name=mux streamable=true "
      "! appsink name=sink sync=false emit-signals=true";
  if (config.has_audio) {
    desc +=
        " appsrc name=audiosrc is-live=true format=time "
        "caps=audio/x-raw,format=S16LE,layout=interleaved"
        ",rate=" + std::to_string(config.audio_sample_rate) +
        ",channels=" + std::to_string(config.audio_channels) +
        " ! queue "
        "! audioconvert "
        "! audioresample "
        "! vorbisenc "
        "! queue "
        "! mux.";
  }
  return desc;
}

}  // namespace

GstEncoderBackend::~GstEncoderBackend() {
  if (state_ == State::kRunning) Stop();
  CleanupPipeline();
}

bool GstEncoderBackend::Initialize(const EncoderConfig& config,
                                   ChunkCallback on_chunk) {
  if (state_ != State::kIdle) return false;
  if (config.width <= 0 || config.height <= 0 || config.fps <= 0 ||
      (config.width & 1) || (config.height & 1)) {
    SNAPREEL_LOG_ERROR("Encoder: invalid geometry {}x{} @{}fps", config.width,
                       config.height, config.fps);
    return false;
  }
  if (!on_chunk) return false;

  // Process-global, idempotent.
  gst_init(nullptr, nullptr);

  config_ = config;
  on_chunk_ = std::move(on_chunk);
  frame_duration_ns_ = GST_SECOND / config.fps;

  std::string desc = BuildPipelineDescription(config);
  GError* error = nullptr;
  pipeline_ = gst_parse_launch(desc.c_str(), &error);
  if (!pipeline_ || error) {
    SNAPREEL_LOG_ERROR("GStreamer pipeline creation failed: {}",
                       error ? error->message : "unknown");
    if (error) g_error_free(error);
    CleanupPipeline();
    return false;
  }

  video_src_ = gst_bin_get_by_name(GST_BIN(pipeline_), "videosrc");
  sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), "sink");
  if (config.has_audio) {
    audio_src_ = gst_bin_get_by_name(GST_BIN(pipeline_), "audiosrc");
  }
  if (!video_src_ || !sink_ || (config.has_audio && !audio_src_)) {
    SNAPREEL_LOG_ERROR("Failed to look up encoder pipeline elements");
    CleanupPipeline();
    return false;
  }

  g_signal_connect(sink_, "new-sample",
                   G_CALLBACK(&GstEncoderBackend::OnNewSample), this);

  state_ = State::kReady;
  SNAPREEL_LOG_INFO("Encoder initialized: {}x{} @{}fps, {}bps, audio={}",
                    config.width, config.height, config.fps,
                    config.video_bitrate, config.has_audio);
  return true;
}

bool GstEncoderBackend::Start() {
  if (state_ != State::kReady) return false;

  GstStateChangeReturn ret =
      gst_element_set_state(pipeline_, GST_STATE_PLAYING);
  if (ret == GST_STATE_CHANGE_FAILURE) {
    SNAPREEL_LOG_ERROR("Failed to set encoder pipeline to PLAYING");
    return false;
  }

  audio_frames_written_ = 0;
  audio_origin_ns_ = -1;
  bytes_out_.store(0);
  state_ = State::kRunning;
  return true;
}

bool GstEncoderBackend::WriteVideoFrame(const Image& frame,
                                        int64_t timestamp_ns) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (state_ != State::kRunning) return false;
  if (frame.width() != config_.width || frame.height() != config_.height) {
    SNAPREEL_LOG_ERROR("Encoder: frame {}x{} does not match {}x{}",
                       frame.width(), frame.height(), config_.width,
                       config_.height);
    return false;
  }

  gsize row_bytes = static_cast<gsize>(config_.width) * 4;
  gsize buf_size = row_bytes * config_.height;
  GstBuffer* buffer = gst_buffer_new_allocate(nullptr, buf_size, nullptr);
  if (!buffer) {
    SNAPREEL_LOG_ERROR("gst_buffer_new_allocate failed");
    return false;
  }

  GstMapInfo map;
  if (!gst_buffer_map(buffer, &map, GST_MAP_WRITE)) {
    gst_buffer_unref(buffer);
    return false;
  }
  // Row-by-row: source stride may be padded.
  const uint8_t* src = frame.data();
  for (int row = 0; row < config_.height; ++row) {
    std::memcpy(map.data + row * row_bytes, src + row * frame.stride(),
                row_bytes);
  }
  gst_buffer_unmap(buffer, &map);

  GST_BUFFER_PTS(buffer) = static_cast<GstClockTime>(timestamp_ns);
  GST_BUFFER_DURATION(buffer) = frame_duration_ns_;

  // Takes ownership of the buffer.
  GstFlowReturn flow =
      gst_app_src_push_buffer(GST_APP_SRC(video_src_), buffer);
  if (flow != GST_FLOW_OK) {
    SNAPREEL_LOG_ERROR("Video push failed: {}", gst_flow_get_name(flow));
    return false;
  }
  return true;
}

bool GstEncoderBackend::WriteAudio(const AudioSamples& samples) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (state_ != State::kRunning || !audio_src_) return true;
  if (samples.data.empty()) return true;
  if (samples.sample_rate != config_.audio_sample_rate ||
      samples.channels != config_.audio_channels) {
    SNAPREEL_LOG_WARN("Encoder: dropping audio with format {}Hz/{}ch",
                      samples.sample_rate, samples.channels);
    return false;
  }

  gsize size = samples.data.size() * sizeof(int16_t);
  GstBuffer* buffer = gst_buffer_new_allocate(nullptr, size, nullptr);
  if (!buffer) return false;
  gst_buffer_fill(buffer, 0, samples.data.data(), size);

  // Timestamps follow the running sample count so gaps never reorder audio.
  // A source that dropped more than half a second jumps the count forward.
  uint64_t frames = samples.data.size() / config_.audio_channels;
  if (audio_origin_ns_ < 0) audio_origin_ns_ = samples.timestamp_ns;
  int64_t since_origin_ns = samples.timestamp_ns - audio_origin_ns_;
  if (since_origin_ns > 0) {
    uint64_t expected = gst_util_uint64_scale(
        static_cast<uint64_t>(since_origin_ns), config_.audio_sample_rate,
        GST_SECOND);
    if (expected > audio_frames_written_ + config_.audio_sample_rate / 2) {
      SNAPREEL_LOG_WARN("Encoder: audio gap of {} frames",
                        expected - audio_frames_written_);
      audio_frames_written_ = expected;
    }
  }
  GST_BUFFER_PTS(buffer) = gst_util_uint64_scale(
      audio_frames_written_, GST_SECOND, config_.audio_sample_rate);
  GST_BUFFER_DURATION(buffer) =
      gst_util_uint64_scale(frames, GST_SECOND, config_.audio_sample_rate);
  audio_frames_written_ += frames;

  GstFlowReturn flow =
      gst_app_src_push_buffer(GST_APP_SRC(audio_src_), buffer);
  if (flow != GST_FLOW_OK) {
    SNAPREEL_LOG_WARN("Audio push failed: {}", gst_flow_get_name(flow));
    return false;
  }
  return true;
}

bool GstEncoderBackend::Stop() {
  {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (state_ == State::kStopped) return true;
    if (state_ != State::kRunning) {
      state_ = State::kStopped;
      return true;
    }
    state_ = State::kStopped;
  }

  // EOS on every source lets webmmux write its final cluster.
  gst_app_src_end_of_stream(GST_APP_SRC(video_src_));
  if (audio_src_) gst_app_src_end_of_stream(GST_APP_SRC(audio_src_));

  bool ok = true;
  GstBus* bus = gst_element_get_bus(pipeline_);
  if (bus) {
    GstMessage* msg = gst_bus_timed_pop_filtered(
        bus, kEosTimeoutSec * GST_SECOND,
        static_cast<GstMessageType>(GST_MESSAGE_EOS | GST_MESSAGE_ERROR));
    if (!msg) {
      SNAPREEL_LOG_ERROR("Encoder: timed out waiting for EOS");
      ok = false;
    } else {
      if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
        GError* err = nullptr;
        gst_message_parse_error(msg, &err, nullptr);
        SNAPREEL_LOG_ERROR("GStreamer pipeline error: {}",
                           err ? err->message : "unknown");
        if (err) g_error_free(err);
        ok = false;
      }
      gst_message_unref(msg);
    }
    gst_object_unref(bus);
  }

  gst_element_set_state(pipeline_, GST_STATE_NULL);
  SNAPREEL_LOG_INFO("Encoder stopped: {} bytes", bytes_out_.load());
  return ok;
}

GstFlowReturn GstEncoderBackend::OnNewSample(GstElement* sink,
                                             gpointer user_data) {
  auto* self = static_cast<GstEncoderBackend*>(user_data);
  GstSample* sample = gst_app_sink_pull_sample(GST_APP_SINK(sink));
  if (!sample) return GST_FLOW_EOS;
  self->DeliverSample(sample);
  gst_sample_unref(sample);
  return GST_FLOW_OK;
}

void GstEncoderBackend::DeliverSample(GstSample* sample) {
  GstBuffer* buffer = gst_sample_get_buffer(sample);
  if (!buffer) return;
  GstMapInfo map;
  if (!gst_buffer_map(buffer, &map, GST_MAP_READ)) return;
  std::vector<uint8_t> chunk(map.data, map.data + map.size);
  gst_buffer_unmap(buffer, &map);

  bytes_out_.fetch_add(chunk.size());
  on_chunk_(std::move(chunk));
}

void GstEncoderBackend::CleanupPipeline() {
  if (video_src_) {
    gst_object_unref(video_src_);
    video_src_ = nullptr;
  }
  if (audio_src_) {
    gst_object_unref(audio_src_);
    audio_src_ = nullptr;
  }
  if (sink_) {
    gst_object_unref(sink_);
    sink_ = nullptr;
  }
  if (pipeline_) {
    gst_element_set_state(pipeline_, GST_STATE_NULL);
    gst_object_unref(pipeline_);
    pipeline_ = nullptr;
  }
}

std::unique_ptr<EncoderBackend> CreatePlatformEncoder() {
  return std::make_unique<GstEncoderBackend>();
}

}  // namespace internal
}  // namespace snapreel
