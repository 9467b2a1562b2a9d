// Copyright 2026 The snapreel Authors

#include "core/app_settings.h"

#include <sys/stat.h>

#include <cstdlib>

#include "core/logger.h"

namespace snapreel {
namespace internal {

namespace {

std::string DefaultSavePath() {
  const char* pictures = std::getenv("XDG_PICTURES_DIR");
  if (pictures && pictures[0]) return pictures;
  const char* home = std::getenv("HOME");
  if (!home || !home[0]) return "/tmp";
  std::string pictures_dir = std::string(home) + "/Pictures";
  struct stat st;
  if (stat(pictures_dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
    return pictures_dir;
  }
  return home;
}

}  // namespace

AppSettings DefaultAppSettings() {
  AppSettings s;
  s.save_path = DefaultSavePath();
  return s;
}

bool IsSupportedFrameRate(int fps) {
  return fps == 30 || fps == 60 || fps == 90;
}

const char* ImageFormatName(SnapReelImageFormat format) {
  return format == kSnapReelImageJpeg ? "jpeg" : "png";
}

const char* ImageExtension(SnapReelImageFormat format) {
  return format == kSnapReelImageJpeg ? "jpg" : "png";
}

const char* VideoFormatName(SnapReelVideoFormat format) {
  return format == kSnapReelVideoMp4 ? "mp4" : "webm";
}

const char* AudioSourceName(SnapReelAudioSource source) {
  switch (source) {
    case kSnapReelAudioSystem:     return "system";
    case kSnapReelAudioMicrophone: return "mic";
    default:                       return "none";
  }
}

const char* ShortcutModeName(SnapReelShortcutMode mode) {
  return mode == kSnapReelShortcutAlternative ? "alternative" : "standard";
}

bool ParseImageFormat(const std::string& s, SnapReelImageFormat* out) {
  if (s == "png") { *out = kSnapReelImagePng; return true; }
  if (s == "jpeg" || s == "jpg") { *out = kSnapReelImageJpeg; return true; }
  return false;
}

bool ParseVideoFormat(const std::string& s, SnapReelVideoFormat* out) {
  if (s == "webm") { *out = kSnapReelVideoWebm; return true; }
  if (s == "mp4") { *out = kSnapReelVideoMp4; return true; }
  return false;
}

bool ParseAudioSource(const std::string& s, SnapReelAudioSource* out) {
  if (s == "none") { *out = kSnapReelAudioNone; return true; }
  if (s == "system") { *out = kSnapReelAudioSystem; return true; }
  if (s == "mic") { *out = kSnapReelAudioMicrophone; return true; }
  return false;
}

bool ParseShortcutMode(const std::string& s, SnapReelShortcutMode* out) {
  if (s == "standard") { *out = kSnapReelShortcutStandard; return true; }
  if (s == "alternative") { *out = kSnapReelShortcutAlternative; return true; }
  return false;
}

AppSettings LoadAppSettings(IPlatformSettings* store) {
  AppSettings s = DefaultAppSettings();
  if (!store) return s;

  std::string str;
  if (store->GetString(kKeySavePath, &str) && !str.empty()) s.save_path = str;
  if (store->GetString(kKeyImageFormat, &str) &&
      !ParseImageFormat(str, &s.image_format)) {
    SNAPREEL_LOG_WARN("Ignoring invalid {}='{}'", kKeyImageFormat, str);
  }
  if (store->GetString(kKeyVideoFormat, &str) &&
      !ParseVideoFormat(str, &s.video_format)) {
    SNAPREEL_LOG_WARN("Ignoring invalid {}='{}'", kKeyVideoFormat, str);
  }
  if (store->GetString(kKeyAudioSource, &str) &&
      !ParseAudioSource(str, &s.audio_source)) {
    SNAPREEL_LOG_WARN("Ignoring invalid {}='{}'", kKeyAudioSource, str);
  }
  if (store->GetString(kKeyShortcutMode, &str) &&
      !ParseShortcutMode(str, &s.shortcut_mode)) {
    SNAPREEL_LOG_WARN("Ignoring invalid {}='{}'", kKeyShortcutMode, str);
  }

  int value = 0;
  if (store->GetInt(kKeyFrameRate, &value)) {
    if (IsSupportedFrameRate(value)) {
      s.frame_rate = value;
    } else {
      SNAPREEL_LOG_WARN("Ignoring unsupported {}={}", kKeyFrameRate, value);
    }
  }
  if (store->GetInt(kKeyFreezeStill, &value)) s.freeze_still = value != 0;
  return s;
}

bool SaveAppSettings(const AppSettings& settings, IPlatformSettings* store) {
  if (!store) return false;
  bool ok = true;
  ok &= store->SetString(kKeySavePath, settings.save_path.c_str());
  ok &= store->SetString(kKeyImageFormat, ImageFormatName(settings.image_format));
  ok &= store->SetString(kKeyVideoFormat, VideoFormatName(settings.video_format));
  ok &= store->SetString(kKeyAudioSource, AudioSourceName(settings.audio_source));
  ok &= store->SetInt(kKeyFrameRate, settings.frame_rate);
  ok &= store->SetString(kKeyShortcutMode,
                         ShortcutModeName(settings.shortcut_mode));
  ok &= store->SetInt(kKeyFreezeStill, settings.freeze_still ? 1 : 0);
  if (!ok) SNAPREEL_LOG_WARN("Some settings could not be saved");
  return ok;
}

}  // namespace internal
}  // namespace snapreel
