// Copyright 2026 The snapreel Authors
// IPlatformSettings backed by an INI file.

#ifndef SNAPREEL_CORE_INI_SETTINGS_H_
#define SNAPREEL_CORE_INI_SETTINGS_H_

#include <map>
#include <memory>
#include <string>

#include "core/platform_services.h"

namespace snapreel {
namespace internal {

/// Flat "key=value" store under a single [Settings] section. Every write is
/// persisted immediately.
class IniSettingsStore : public IPlatformSettings {
 public:
  explicit IniSettingsStore(std::string path);

  bool GetInt(const char* key, int* out_value) override;
  bool SetInt(const char* key, int value) override;
  bool GetString(const char* key, std::string* out_value) override;
  bool SetString(const char* key, const char* value) override;

  const std::string& path() const { return path_; }

  /// Re-read the file, discarding unsaved state.
  void Reload();

 private:
  bool Save();

  std::string path_;
  std::map<std::string, std::string> data_;
};

/// $XDG_CONFIG_HOME/snapreel/settings.ini (or ~/.config/...).
std::string DefaultSettingsPath();

/// $XDG_STATE_HOME/snapreel/crash.log (or ~/.local/state/...).
std::string DefaultCrashLogPath();

/// Settings store at DefaultSettingsPath().
std::unique_ptr<IPlatformSettings> CreatePlatformSettings();

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_INI_SETTINGS_H_
