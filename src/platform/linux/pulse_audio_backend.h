// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_PLATFORM_LINUX_PULSE_AUDIO_BACKEND_H_
#define SNAPREEL_PLATFORM_LINUX_PULSE_AUDIO_BACKEND_H_

#include <memory>

#include "core/audio_backend.h"

namespace snapreel {
namespace internal {

/// PulseAudio Simple API capture. The microphone is the default source;
/// system audio is the default sink's monitor ("@DEFAULT_MONITOR@").
class PulseAudioBackend : public AudioBackend {
 public:
  PulseAudioBackend() = default;
  ~PulseAudioBackend() override = default;

  bool IsSupported(SnapReelAudioSource source) const override;
  SnapReelError OpenMicrophone(std::unique_ptr<AudioTrack>* out_track) override;
  SnapReelError OpenSystemAudio(
      std::unique_ptr<AudioTrack>* out_track) override;

 private:
  SnapReelError Open(const char* device, const char* stream_name,
                     std::unique_ptr<AudioTrack>* out_track);
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_PLATFORM_LINUX_PULSE_AUDIO_BACKEND_H_
