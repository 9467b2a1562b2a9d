// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_PLATFORM_LINUX_GST_TRANSCODER_H_
#define SNAPREEL_PLATFORM_LINUX_GST_TRANSCODER_H_

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include "core/transcoder.h"

namespace snapreel {
namespace internal {

/// WebM -> MP4 conversion on a private thread:
///   filesrc ! decodebin ! {x264enc | AAC encoder} ! mp4mux ! filesink
/// One job runs at a time.
class GstTranscoder : public Transcoder {
 public:
  GstTranscoder() = default;
  ~GstTranscoder() override;

  bool TranscodeAsync(const std::string& input_path,
                      const std::string& output_path,
                      SnapReelVideoFormat target,
                      TranscodeCallback done) override;

 private:
  void Run(std::string input_path, std::string output_path,
           TranscodeCallback done);

  std::mutex job_mutex_;
  std::thread job_;
  std::atomic<bool> busy_{false};
  std::atomic<bool> cancel_{false};
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_PLATFORM_LINUX_GST_TRANSCODER_H_
