// Copyright 2026 The snapreel Authors

#include "core/frame_compositor.h"

#include <chrono>
#include <exception>
#include <utility>

#include "core/logger.h"

namespace snapreel {
namespace internal {

FrameCompositor::~FrameCompositor() { Stop(); }

bool FrameCompositor::Configure(VideoTrack* source, const SelectionRect& rect,
                                int fps, FrameSink sink) {
  if (running()) {
    SNAPREEL_LOG_ERROR("FrameCompositor: configure while running");
    return false;
  }
  if (fps <= 0) return false;

  int dw = EvenFloor(rect.width);
  int dh = EvenFloor(rect.height);
  auto dest = Image::Create(dw, dh, kSnapReelFormatBgra8);
  if (!dest) {
    SNAPREEL_LOG_ERROR("FrameCompositor: invalid destination {}x{}", dw, dh);
    return false;
  }

  std::lock_guard<std::mutex> lock(source_mutex_);
  source_ = source;
  source_rect_ = ScaleToPhysical(rect);
  dest_ = std::move(dest);
  fps_ = fps;
  sink_ = std::move(sink);
  frames_drawn_.store(0, std::memory_order_release);
  ticks_.store(0, std::memory_order_release);

  SNAPREEL_LOG_INFO(
      "FrameCompositor: {}x{} @{}fps from physical [{},{} {}x{}]", dw, dh,
      fps_, source_rect_.x, source_rect_.y, source_rect_.width,
      source_rect_.height);
  return true;
}

FrameCompositor::TickResult FrameCompositor::Tick() {
  if (!dest_) return TickResult::kSkipped;
  int64_t index = ticks_.fetch_add(1, std::memory_order_acq_rel);
  TickResult result = DrawFrame(index * 1000000000LL / fps_);
  if (result != TickResult::kFailed && tick_hook_) tick_hook_();
  return result;
}

FrameCompositor::TickResult FrameCompositor::DrawFrame(int64_t timestamp_ns) {
  std::unique_ptr<Image> frame;
  {
    std::lock_guard<std::mutex> lock(source_mutex_);
    if (!source_) return TickResult::kSkipped;
    if (!source_->IsLive() || source_->IsPaused()) return TickResult::kSkipped;
    frame = source_->ReadFrame();
  }
  if (!frame) return TickResult::kSkipped;

  if (!BlitScaled(*frame, source_rect_, dest_.get())) {
    SNAPREEL_LOG_DEBUG("FrameCompositor: source rect outside frame, skipped");
    return TickResult::kSkipped;
  }

  if (sink_ && !sink_(*dest_, timestamp_ns)) {
    return TickResult::kFailed;
  }
  frames_drawn_.fetch_add(1, std::memory_order_acq_rel);
  return TickResult::kDrawn;
}

bool FrameCompositor::Start() {
  if (!dest_) {
    SNAPREEL_LOG_ERROR("FrameCompositor: start before configure");
    return false;
  }
  if (running_.load(std::memory_order_acquire)) return true;
  if (loop_thread_.joinable()) loop_thread_.join();

  running_.store(true, std::memory_order_release);
  loop_thread_ = std::thread(&FrameCompositor::LoopFunc, this);
  SNAPREEL_LOG_INFO("FrameCompositor loop started");
  return true;
}

void FrameCompositor::Stop() {
  running_.store(false, std::memory_order_release);
  if (loop_thread_.joinable()) {
    loop_thread_.join();
    SNAPREEL_LOG_INFO("FrameCompositor loop stopped ({} frames)",
                      frames_drawn());
  }
}

void FrameCompositor::Detach() {
  std::lock_guard<std::mutex> lock(source_mutex_);
  source_ = nullptr;
}

/// Background thread: read -> crop/scale -> sink, paced to fps_ against a
/// fixed schedule so tick count tracks wall-clock time.
void FrameCompositor::LoopFunc() {
  const auto interval = std::chrono::microseconds(1000000 / fps_);
  auto next_tick = std::chrono::steady_clock::now();

  while (running_.load(std::memory_order_acquire)) {
    SnapReelError fault = kSnapReelOk;
    try {
      if (Tick() == TickResult::kFailed) {
        SNAPREEL_LOG_ERROR("FrameCompositor: encoder rejected frame, stopping");
        fault = kSnapReelErrorEncodingFailed;
      }
    } catch (const std::exception& e) {
      SNAPREEL_LOG_ERROR("FrameCompositor: tick threw, stopping: {}", e.what());
      fault = kSnapReelErrorUnknown;
    }
    if (fault != kSnapReelOk) {
      running_.store(false, std::memory_order_release);
      if (fault_hook_) fault_hook_(fault);
      break;
    }

    next_tick += interval;
    std::this_thread::sleep_until(next_tick);
  }
}

}  // namespace internal
}  // namespace snapreel
