// Copyright 2026 The snapreel Authors

#include "core/ini_settings.h"

#include <cstdlib>
#include <fstream>
#include <utility>

#include "core/logger.h"
#include "core/output_naming.h"

namespace snapreel {
namespace internal {

namespace {

std::string GetXDGConfigHome() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && xdg[0]) return xdg;
  const char* home = std::getenv("HOME");
  if (home) return std::string(home) + "/.config";
  return "/tmp";
}

std::string GetXDGStateHome() {
  const char* xdg = std::getenv("XDG_STATE_HOME");
  if (xdg && xdg[0]) return xdg;
  const char* home = std::getenv("HOME");
  if (home) return std::string(home) + "/.local/state";
  return "/tmp";
}

std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos) return std::string();
  size_t e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

}  // namespace

IniSettingsStore::IniSettingsStore(std::string path) : path_(std::move(path)) {
  Reload();
}

void IniSettingsStore::Reload() {
  data_.clear();
  std::ifstream f(path_);
  if (!f) return;
  std::string line;
  while (std::getline(f, line)) {
    if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[') {
      continue;
    }
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string key = Trim(line.substr(0, eq));
    if (key.empty()) continue;
    data_[key] = Trim(line.substr(eq + 1));
  }
}

bool IniSettingsStore::GetInt(const char* key, int* out_value) {
  if (!key || !out_value) return false;
  auto it = data_.find(key);
  if (it == data_.end()) return false;
  char* end = nullptr;
  long v = std::strtol(it->second.c_str(), &end, 10);
  if (end == it->second.c_str() || *end != '\0') return false;
  *out_value = static_cast<int>(v);
  return true;
}

bool IniSettingsStore::SetInt(const char* key, int value) {
  if (!key) return false;
  data_[key] = std::to_string(value);
  return Save();
}

bool IniSettingsStore::GetString(const char* key, std::string* out_value) {
  if (!key || !out_value) return false;
  auto it = data_.find(key);
  if (it == data_.end()) return false;
  *out_value = it->second;
  return true;
}

bool IniSettingsStore::SetString(const char* key, const char* value) {
  if (!key || !value) return false;
  data_[key] = value;
  return Save();
}

bool IniSettingsStore::Save() {
  if (!EnsureDirectory(DirName(path_))) {
    SNAPREEL_LOG_WARN("Cannot create settings directory for {}", path_);
    return false;
  }
  std::ofstream f(path_, std::ios::trunc);
  if (!f) {
    SNAPREEL_LOG_WARN("Cannot write settings file {}", path_);
    return false;
  }
  f << "[Settings]\n";
  for (const auto& kv : data_) {
    f << kv.first << "=" << kv.second << "\n";
  }
  return f.good();
}

std::string DefaultSettingsPath() {
  return GetXDGConfigHome() + "/snapreel/settings.ini";
}

std::string DefaultCrashLogPath() {
  return GetXDGStateHome() + "/snapreel/crash.log";
}

std::unique_ptr<IPlatformSettings> CreatePlatformSettings() {
  return std::make_unique<IniSettingsStore>(DefaultSettingsPath());
}

}  // namespace internal
}  // namespace snapreel
