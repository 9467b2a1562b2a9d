// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_TRANSCODER_H_
#define SNAPREEL_CORE_TRANSCODER_H_

#include <functional>
#include <memory>
#include <string>

#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

/// Completion callback. |error| is empty on success. Invoked exactly once,
/// possibly from a transcoder-owned thread.
using TranscodeCallback =
    std::function<void(bool ok, const std::string& error)>;

/// Converts a finished recording to another container, off the caller's
/// thread.
class Transcoder {
 public:
  virtual ~Transcoder() = default;

  // Non-copyable.
  Transcoder(const Transcoder&) = delete;
  Transcoder& operator=(const Transcoder&) = delete;

  /// Start converting |input_path| into |output_path|. Returns false if the
  /// job could not be started, in which case |done| is not invoked.
  virtual bool TranscodeAsync(const std::string& input_path,
                              const std::string& output_path,
                              SnapReelVideoFormat target,
                              TranscodeCallback done) = 0;

 protected:
  Transcoder() = default;
};

/// Factory function implemented per-platform.
std::unique_ptr<Transcoder> CreatePlatformTranscoder();

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_TRANSCODER_H_
