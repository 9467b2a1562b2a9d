// Copyright 2026 The snapreel Authors

#include "core/output_naming.h"

#include <sys/stat.h>

#include <cerrno>
#include <ctime>

namespace snapreel {
namespace internal {

std::string FileTimestamp(std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);
  char buf[32] = {};
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tm_utc);
  return buf;
}

std::string OutputFileName(const std::string& prefix,
                           std::chrono::system_clock::time_point when,
                           const std::string& extension) {
  return prefix + "-" + FileTimestamp(when) + "." + extension;
}

std::string JoinPath(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  if (dir.back() == '/') return dir + name;
  return dir + "/" + name;
}

std::string ReplaceExtension(const std::string& path,
                             const std::string& extension) {
  auto slash = path.find_last_of('/');
  auto dot = path.find_last_of('.');
  if (dot == std::string::npos ||
      (slash != std::string::npos && dot < slash)) {
    return path + "." + extension;
  }
  return path.substr(0, dot + 1) + extension;
}

bool EnsureDirectory(const std::string& dir) {
  if (dir.empty()) return true;
  for (size_t pos = 1; pos <= dir.size(); ++pos) {
    if (pos == dir.size() || dir[pos] == '/') {
      std::string part = dir.substr(0, pos);
      if (mkdir(part.c_str(), 0755) != 0 && errno != EEXIST) return false;
    }
  }
  struct stat st;
  return stat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string DirName(const std::string& path) {
  auto slash = path.find_last_of('/');
  if (slash == std::string::npos) return std::string();
  if (slash == 0) return "/";
  return path.substr(0, slash);
}

}  // namespace internal
}  // namespace snapreel
