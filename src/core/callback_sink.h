// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_CALLBACK_SINK_H_
#define SNAPREEL_CORE_CALLBACK_SINK_H_

#include <mutex>
#include <string>

#include "spdlog/sinks/base_sink.h"

#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

/// Hands each log line to the snapreel_log_callback_t registered through
/// snapreel_set_log_callback(), one line per call, without its newline.
/// The embedding app uses it to mirror diagnostics into its own UI.
class CallbackSink : public spdlog::sinks::base_sink<std::mutex> {
  using Base = spdlog::sinks::base_sink<std::mutex>;

 public:
  CallbackSink() = default;

  /// A null |callback| turns the sink into a no-op.
  void SetCallback(snapreel_log_callback_t callback, void* userdata) {
    std::lock_guard<std::mutex> lock(Base::mutex_);
    callback_ = callback;
    userdata_ = userdata;
  }

 protected:
  // Called with Base::mutex_ held.
  void sink_it_(const spdlog::details::log_msg& msg) override {
    if (!callback_) return;

    spdlog::memory_buf_t buf;
    Base::formatter_->format(msg, buf);
    std::string line(buf.data(), buf.size());
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
      line.pop_back();
    }
    callback_(ToSnapReelLevel(msg.level), line.c_str(), userdata_);
  }

  void flush_() override {}

 private:
  static SnapReelLogLevel ToSnapReelLevel(spdlog::level::level_enum level) {
    switch (level) {
      case spdlog::level::trace:    return kSnapReelLogTrace;
      case spdlog::level::debug:    return kSnapReelLogDebug;
      case spdlog::level::warn:     return kSnapReelLogWarn;
      case spdlog::level::err:      return kSnapReelLogError;
      case spdlog::level::critical:
      case spdlog::level::off:      return kSnapReelLogFatal;
      case spdlog::level::info:
      default:                      return kSnapReelLogInfo;
    }
  }

  snapreel_log_callback_t callback_ = nullptr;
  void* userdata_ = nullptr;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_CALLBACK_SINK_H_
