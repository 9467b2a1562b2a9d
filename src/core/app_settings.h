// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_APP_SETTINGS_H_
#define SNAPREEL_CORE_APP_SETTINGS_H_

#include <string>

#include "core/platform_services.h"
#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

// Settings keys.
static constexpr char kKeySavePath[] = "SavePath";
static constexpr char kKeyImageFormat[] = "ImageFormat";
static constexpr char kKeyVideoFormat[] = "VideoFormat";
static constexpr char kKeyAudioSource[] = "AudioSource";
static constexpr char kKeyFrameRate[] = "FrameRate";
static constexpr char kKeyShortcutMode[] = "ShortcutMode";
static constexpr char kKeyFreezeStill[] = "FreezeStill";

/// User preferences. Copied by value into each operation.
struct AppSettings {
  std::string save_path;
  SnapReelImageFormat image_format = kSnapReelImagePng;
  SnapReelVideoFormat video_format = kSnapReelVideoMp4;
  SnapReelAudioSource audio_source = kSnapReelAudioSystem;
  int frame_rate = 30;  // 30, 60 or 90
  SnapReelShortcutMode shortcut_mode = kSnapReelShortcutStandard;
  bool freeze_still = true;
};

/// Defaults with save_path resolved from the environment
/// ($XDG_PICTURES_DIR, then $HOME/Pictures, then $HOME).
AppSettings DefaultAppSettings();

/// Read settings; missing or invalid values fall back to defaults.
AppSettings LoadAppSettings(IPlatformSettings* store);

/// Persist every field. Returns false if any write failed.
bool SaveAppSettings(const AppSettings& settings, IPlatformSettings* store);

bool IsSupportedFrameRate(int fps);

const char* ImageFormatName(SnapReelImageFormat format);   // "png" / "jpeg"
const char* ImageExtension(SnapReelImageFormat format);    // "png" / "jpg"
const char* VideoFormatName(SnapReelVideoFormat format);   // "webm" / "mp4"
const char* AudioSourceName(SnapReelAudioSource source);   // "none" / ...
const char* ShortcutModeName(SnapReelShortcutMode mode);

bool ParseImageFormat(const std::string& s, SnapReelImageFormat* out);
bool ParseVideoFormat(const std::string& s, SnapReelVideoFormat* out);
bool ParseAudioSource(const std::string& s, SnapReelAudioSource* out);
bool ParseShortcutMode(const std::string& s, SnapReelShortcutMode* out);

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_APP_SETTINGS_H_
