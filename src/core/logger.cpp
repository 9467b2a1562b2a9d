// Copyright 2026 The snapreel Authors

#include "core/logger.h"

#include <algorithm>
#include <mutex>

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"

#include "core/callback_sink.h"

namespace snapreel {
namespace internal {

namespace {

std::once_flag g_init_flag;
std::shared_ptr<spdlog::logger> g_logger;
std::shared_ptr<CallbackSink> g_callback_sink;

std::mutex g_crash_mutex;
spdlog::sink_ptr g_crash_sink;

void DetachCrashSinkLocked() {
  if (!g_crash_sink) return;
  auto& sinks = g_logger->sinks();
  sinks.erase(std::remove(sinks.begin(), sinks.end(), g_crash_sink),
              sinks.end());
  g_crash_sink->flush();
  g_crash_sink.reset();
}

}  // namespace

void InitLogger() {
  std::call_once(g_init_flag, []() {
    auto stderr_sink =
        std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_callback_sink = std::make_shared<CallbackSink>();

    spdlog::sinks_init_list sinks = {stderr_sink, g_callback_sink};
    g_logger = std::make_shared<spdlog::logger>("snapreel", sinks);

    // Default pattern: [snapreel][level] message
    g_logger->set_pattern("[snapreel][%l] %v");
    g_logger->set_level(spdlog::level::info);
    g_logger->flush_on(spdlog::level::warn);
  });
}

std::shared_ptr<spdlog::logger> GetLogger() {
  InitLogger();
  return g_logger;
}

std::shared_ptr<CallbackSink> GetCallbackSink() {
  InitLogger();
  return g_callback_sink;
}

bool EnableCrashLog(const std::string& path) {
  InitLogger();
  std::lock_guard<std::mutex> lock(g_crash_mutex);
  DetachCrashSinkLocked();

  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
  try {
    // basic_file_sink creates missing parent directories.
    sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
  } catch (const spdlog::spdlog_ex& e) {
    SNAPREEL_LOG_WARN("Cannot open crash log '{}': {}", path, e.what());
    return false;
  }
  sink->set_level(spdlog::level::warn);
  sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
  g_crash_sink = sink;
  g_logger->sinks().push_back(g_crash_sink);
  return true;
}

void DisableCrashLog() {
  InitLogger();
  std::lock_guard<std::mutex> lock(g_crash_mutex);
  DetachCrashSinkLocked();
}

void SetLogLevel(SnapReelLogLevel level) {
  InitLogger();
  g_logger->set_level(ToSpdlogLevel(level));
}

spdlog::level::level_enum ToSpdlogLevel(SnapReelLogLevel level) {
  switch (level) {
    case kSnapReelLogTrace: return spdlog::level::trace;
    case kSnapReelLogDebug: return spdlog::level::debug;
    case kSnapReelLogInfo:  return spdlog::level::info;
    case kSnapReelLogWarn:  return spdlog::level::warn;
    case kSnapReelLogError: return spdlog::level::err;
    case kSnapReelLogFatal: return spdlog::level::critical;
    default:                return spdlog::level::info;
  }
}

}  // namespace internal
}  // namespace snapreel
