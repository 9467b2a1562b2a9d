// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_LOGGER_H_
#define SNAPREEL_CORE_LOGGER_H_

#include <memory>
#include <string>

#include "spdlog/spdlog.h"

#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

class CallbackSink;

/// Set up the shared "snapreel" logger: colored stderr output plus the
/// embedder callback sink. Only the first call does any work.
void InitLogger();

/// The shared logger, created on first use.
std::shared_ptr<spdlog::logger> GetLogger();

/// The sink behind snapreel_set_log_callback().
std::shared_ptr<CallbackSink> GetCallbackSink();

/// Route warnings and errors to |path| as well, so a run that dies leaves a
/// trace on disk. Missing directories are created and an earlier crash log
/// is replaced. Returns false when the file cannot be opened.
bool EnableCrashLog(const std::string& path);

void DisableCrashLog();

void SetLogLevel(SnapReelLogLevel level);

spdlog::level::level_enum ToSpdlogLevel(SnapReelLogLevel level);

}  // namespace internal
}  // namespace snapreel

// Logging entry points for library and app code. Arguments use fmt syntax.

#define SNAPREEL_LOG_TRACE(...)  SPDLOG_LOGGER_TRACE(::snapreel::internal::GetLogger(), __VA_ARGS__)
#define SNAPREEL_LOG_DEBUG(...)  SPDLOG_LOGGER_DEBUG(::snapreel::internal::GetLogger(), __VA_ARGS__)
#define SNAPREEL_LOG_INFO(...)   SPDLOG_LOGGER_INFO(::snapreel::internal::GetLogger(), __VA_ARGS__)
#define SNAPREEL_LOG_WARN(...)   SPDLOG_LOGGER_WARN(::snapreel::internal::GetLogger(), __VA_ARGS__)
#define SNAPREEL_LOG_ERROR(...)  SPDLOG_LOGGER_ERROR(::snapreel::internal::GetLogger(), __VA_ARGS__)
#define SNAPREEL_LOG_FATAL(...)  SPDLOG_LOGGER_CRITICAL(::snapreel::internal::GetLogger(), __VA_ARGS__)

#endif  // SNAPREEL_CORE_LOGGER_H_
