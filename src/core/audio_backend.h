// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_AUDIO_BACKEND_H_
#define SNAPREEL_CORE_AUDIO_BACKEND_H_

#include <memory>
#include <string>

#include "core/media_track.h"
#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

/// Abstract interface for platform-specific audio capture.
///
///   Linux: PulseAudio (microphone = default source,
///          system = default sink monitor)
class AudioBackend {
 public:
  virtual ~AudioBackend() = default;

  // Non-copyable.
  AudioBackend(const AudioBackend&) = delete;
  AudioBackend& operator=(const AudioBackend&) = delete;

  /// Whether the given source kind can be captured on this platform.
  virtual bool IsSupported(SnapReelAudioSource source) const = 0;

  /// Open the default microphone.
  /// @return kSnapReelOk and a started track in |out_track|, or
  ///         kSnapReelErrorPermissionDenied / kSnapReelErrorAcquisitionFailed.
  virtual SnapReelError OpenMicrophone(std::unique_ptr<AudioTrack>* out_track) = 0;

  /// Open a loopback of the system output.
  virtual SnapReelError OpenSystemAudio(
      std::unique_ptr<AudioTrack>* out_track) = 0;

 protected:
  AudioBackend() = default;
};

/// Factory function, returns the platform-native audio backend.
/// Defined per-platform in platform/<os>/xxx_audio_backend.cpp.
std::unique_ptr<AudioBackend> CreatePlatformAudioBackend();

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_AUDIO_BACKEND_H_
