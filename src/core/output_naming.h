// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_OUTPUT_NAMING_H_
#define SNAPREEL_CORE_OUTPUT_NAMING_H_

#include <chrono>
#include <string>

namespace snapreel {
namespace internal {

/// UTC timestamp "YYYY-MM-DDTHH-MM-SS" (ISO 8601 with ':' replaced by '-'
/// and fractional seconds dropped).
std::string FileTimestamp(std::chrono::system_clock::time_point when);

/// "<prefix>-<timestamp>.<extension>"
std::string OutputFileName(const std::string& prefix,
                           std::chrono::system_clock::time_point when,
                           const std::string& extension);

/// Join a directory and file name with exactly one '/'.
std::string JoinPath(const std::string& dir, const std::string& name);

/// Replace the extension of |path| (text after the last '.' in the last
/// path component). Appends if there is none.
std::string ReplaceExtension(const std::string& path,
                             const std::string& extension);

/// mkdir -p. Returns true if the directory exists afterwards.
bool EnsureDirectory(const std::string& dir);

/// Directory part of |path| (everything before the last '/'), or "".
std::string DirName(const std::string& path);

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_OUTPUT_NAMING_H_
