// Copyright 2026 The snapreel Authors
// Linux transcoder, GStreamer decodebin -> x264/AAC -> mp4mux.

#include "platform/linux/gst_transcoder.h"

#include <string>
#include <utility>

#include <gst/gst.h>

#include "core/logger.h"
#include "core/stall_watchdog.h"

namespace snapreel {
namespace internal {

namespace {

// Bus poll period, and how long the output position may stand still before
// the job is declared stalled.
constexpr int kPollIntervalMs = 500;
constexpr int kStallTimeoutSec = 15;

bool HasElement(const char* name) {
  GstElementFactory* factory = gst_element_factory_find(name);
  if (!factory) return false;
  gst_object_unref(factory);
  return true;
}

// First AAC encoder present in the registry, or nullptr.
const char* FindAacEncoder() {
  static const char* const kCandidates[] = {"avenc_aac", "voaacenc",
                                            "fdkaacenc"};
  for (const char* name : kCandidates) {
    if (HasElement(name)) return name;
  }
  return nullptr;
}

/// State shared with the decodebin pad-added handler.
struct LinkContext {
  GstElement* pipeline = nullptr;
  GstElement* mux = nullptr;
  const char* aac_encoder = nullptr;
  bool video_linked = false;
  bool audio_linked = false;
};

// Build "<branch> ! mux" for a freshly exposed decodebin pad.
void OnPadAdded(GstElement* /*decodebin*/, GstPad* pad, gpointer user_data) {
  auto* ctx = static_cast<LinkContext*>(user_data);

  GstCaps* caps = gst_pad_get_current_caps(pad);
  if (!caps) caps = gst_pad_query_caps(pad, nullptr);
  const char* media =
      gst_structure_get_name(gst_caps_get_structure(caps, 0));
  bool is_video = g_str_has_prefix(media, "video/");
  bool is_audio = g_str_has_prefix(media, "audio/");
  gst_caps_unref(caps);

  std::string branch;
  if (is_video && !ctx->video_linked) {
    branch =
        "queue ! videoconvert ! x264enc speed-preset=ultrafast "
        "! video/x-h264,profile=main ! h264parse";
  } else if (is_audio && !ctx->audio_linked) {
    if (!ctx->aac_encoder) {
      SNAPREEL_LOG_WARN("No AAC encoder installed, dropping audio track");
      return;
    }
    branch = std::string("queue ! audioconvert ! audioresample ! ") +
             ctx->aac_encoder + " ! aacparse";
  } else {
    return;
  }

  GError* error = nullptr;
  GstElement* bin =
      gst_parse_bin_from_description(branch.c_str(), TRUE, &error);
  if (!bin || error) {
    SNAPREEL_LOG_ERROR("Transcode branch creation failed: {}",
                       error ? error->message : "unknown");
    if (error) g_error_free(error);
    if (bin) gst_object_unref(bin);
    return;
  }

  gst_bin_add(GST_BIN(ctx->pipeline), bin);
  if (!gst_element_link(bin, ctx->mux)) {
    SNAPREEL_LOG_ERROR("Failed to link {} branch to mp4mux", media);
    return;
  }
  GstPad* sink_pad = gst_element_get_static_pad(bin, "sink");
  GstPadLinkReturn link = gst_pad_link(pad, sink_pad);
  gst_object_unref(sink_pad);
  if (link != GST_PAD_LINK_OK) {
    SNAPREEL_LOG_ERROR("Failed to link decoded {} pad", media);
    return;
  }
  gst_element_sync_state_with_parent(bin);

  if (is_video) ctx->video_linked = true;
  if (is_audio) ctx->audio_linked = true;
}

}  // namespace

GstTranscoder::~GstTranscoder() {
  cancel_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(job_mutex_);
  if (job_.joinable()) job_.join();
}

bool GstTranscoder::TranscodeAsync(const std::string& input_path,
                                   const std::string& output_path,
                                   SnapReelVideoFormat target,
                                   TranscodeCallback done) {
  if (target != kSnapReelVideoMp4) {
    SNAPREEL_LOG_ERROR("Transcoder only produces MP4");
    return false;
  }
  if (input_path.empty() || output_path.empty() || !done) return false;

  std::lock_guard<std::mutex> lock(job_mutex_);
  if (busy_.load(std::memory_order_acquire)) {
    SNAPREEL_LOG_WARN("Transcoder busy, refusing {}", input_path);
    return false;
  }
  if (job_.joinable()) job_.join();

  gst_init(nullptr, nullptr);
  if (!HasElement("x264enc") || !HasElement("mp4mux")) {
    SNAPREEL_LOG_ERROR("x264enc or mp4mux is not installed");
    return false;
  }

  busy_.store(true, std::memory_order_release);
  job_ = std::thread(&GstTranscoder::Run, this, input_path, output_path,
                     std::move(done));
  return true;
}

void GstTranscoder::Run(std::string input_path, std::string output_path,
                        TranscodeCallback done) {
  SNAPREEL_LOG_INFO("Transcoding {} -> {}", input_path, output_path);

  GstElement* pipeline = gst_pipeline_new("transcode");
  GstElement* src = gst_element_factory_make("filesrc", nullptr);
  GstElement* decode = gst_element_factory_make("decodebin", nullptr);
  GstElement* mux = gst_element_factory_make("mp4mux", nullptr);
  GstElement* sink = gst_element_factory_make("filesink", nullptr);

  std::string error_text;
  if (!pipeline || !src || !decode || !mux || !sink) {
    error_text = "missing GStreamer elements";
    for (GstElement* e : {src, decode, mux, sink}) {
      if (e) gst_object_unref(e);
    }
    if (pipeline) gst_object_unref(pipeline);
    busy_.store(false, std::memory_order_release);
    done(false, error_text);
    return;
  }

  g_object_set(src, "location", input_path.c_str(), nullptr);
  g_object_set(sink, "location", output_path.c_str(), nullptr);
  gst_bin_add_many(GST_BIN(pipeline), src, decode, mux, sink, nullptr);

  LinkContext ctx;
  ctx.pipeline = pipeline;
  ctx.mux = mux;
  ctx.aac_encoder = FindAacEncoder();

  bool ok = gst_element_link(src, decode) && gst_element_link(mux, sink);
  if (!ok) {
    error_text = "pipeline link failed";
  } else {
    g_signal_connect(decode, "pad-added", G_CALLBACK(OnPadAdded), &ctx);
    if (gst_element_set_state(pipeline, GST_STATE_PLAYING) ==
        GST_STATE_CHANGE_FAILURE) {
      ok = false;
      error_text = "pipeline refused to start";
    }
  }

  if (ok) {
    GstBus* bus = gst_element_get_bus(pipeline);
    const auto poll = static_cast<GstClockTime>(kPollIntervalMs) * GST_MSECOND;
    StallWatchdog watchdog(static_cast<int64_t>(kStallTimeoutSec) *
                           GST_SECOND);
    for (;;) {
      GstMessage* msg = gst_bus_timed_pop_filtered(
          bus, poll,
          static_cast<GstMessageType>(GST_MESSAGE_EOS | GST_MESSAGE_ERROR));
      if (msg) {
        if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
          GError* err = nullptr;
          gst_message_parse_error(msg, &err, nullptr);
          ok = false;
          error_text = err ? err->message : "unknown";
          if (err) g_error_free(err);
        }
        gst_message_unref(msg);
        break;
      }
      if (cancel_.load(std::memory_order_acquire)) {
        ok = false;
        error_text = "cancelled";
        break;
      }
      gint64 position = -1;
      if (!gst_element_query_position(pipeline, GST_FORMAT_TIME, &position)) {
        position = -1;
      }
      if (watchdog.Sample(position, static_cast<int64_t>(poll))) {
        ok = false;
        error_text = "pipeline stalled";
        break;
      }
    }
    gst_object_unref(bus);
    if (ok && !ctx.video_linked) {
      ok = false;
      error_text = "input has no video stream";
    }
  }

  gst_element_set_state(pipeline, GST_STATE_NULL);
  gst_object_unref(pipeline);

  if (ok) {
    SNAPREEL_LOG_INFO("Transcode finished: {}", output_path);
  } else {
    SNAPREEL_LOG_ERROR("Transcode failed: {}", error_text);
  }
  busy_.store(false, std::memory_order_release);
  done(ok, error_text);
}

std::unique_ptr<Transcoder> CreatePlatformTranscoder() {
  return std::make_unique<GstTranscoder>();
}

}  // namespace internal
}  // namespace snapreel
