// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_FRAME_COMPOSITOR_H_
#define SNAPREEL_CORE_FRAME_COMPOSITOR_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "core/geometry.h"
#include "core/image.h"
#include "core/media_track.h"
#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

/// Crops the selected region out of a live video track into a fixed,
/// even-sized destination frame at a steady rate.
class FrameCompositor {
 public:
  /// Receives the destination frame. Returning false is an encoding fault.
  using FrameSink =
      std::function<bool(const Image& frame, int64_t timestamp_ns)>;
  /// Runs on the loop thread after every tick that did not fail, skipped
  /// ticks included.
  using TickHook = std::function<void()>;
  /// Runs on the loop thread when the loop stops itself on a fault.
  using FaultHook = std::function<void(SnapReelError error)>;

  enum class TickResult {
    kDrawn,
    kSkipped,   // Source ended, paused, detached or had no frame
    kFailed,    // Sink rejected the frame
  };

  FrameCompositor() = default;
  ~FrameCompositor();

  FrameCompositor(const FrameCompositor&) = delete;
  FrameCompositor& operator=(const FrameCompositor&) = delete;

  /// Bind a source and allocate the destination for |rect| (logical pixels,
  /// scale_factor attached or 0 for 1.0).
  /// @return false if the rect yields an empty destination or |fps| <= 0.
  bool Configure(VideoTrack* source, const SelectionRect& rect, int fps,
                 FrameSink sink);

  void SetTickHook(TickHook hook) { tick_hook_ = std::move(hook); }
  void SetFaultHook(FaultHook hook) { fault_hook_ = std::move(hook); }

  /// Draw one frame. Safe to call directly when the loop is not running.
  /// Every tick advances the timeline by 1/fps whether or not it draws.
  TickResult Tick();

  /// Start the loop thread. No-op if already running.
  bool Start();

  /// Stop the loop thread and join it. Idempotent.
  void Stop();

  /// Drop the source; subsequent ticks skip. Call after Stop().
  void Detach();

  bool running() const { return running_.load(std::memory_order_acquire); }
  int fps() const { return fps_; }
  int dest_width() const { return dest_ ? dest_->width() : 0; }
  int dest_height() const { return dest_ ? dest_->height() : 0; }
  const Image* destination() const { return dest_.get(); }
  const PixelRect& source_rect() const { return source_rect_; }
  int64_t frames_drawn() const {
    return frames_drawn_.load(std::memory_order_acquire);
  }
  int64_t ticks() const { return ticks_.load(std::memory_order_acquire); }

 private:
  void LoopFunc();
  TickResult DrawFrame(int64_t timestamp_ns);

  std::mutex source_mutex_;
  VideoTrack* source_ = nullptr;
  PixelRect source_rect_;
  std::unique_ptr<Image> dest_;
  int fps_ = 30;
  FrameSink sink_;
  TickHook tick_hook_;
  FaultHook fault_hook_;

  std::thread loop_thread_;
  std::atomic<bool> running_{false};
  std::atomic<int64_t> frames_drawn_{0};
  std::atomic<int64_t> ticks_{0};
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_FRAME_COMPOSITOR_H_
