// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_STALL_WATCHDOG_H_
#define SNAPREEL_CORE_STALL_WATCHDOG_H_

#include <cstdint>

namespace snapreel {
namespace internal {

/// Tracks a monotonically advancing position (for example a pipeline's
/// output time) sampled at intervals, and reports when it has stood still
/// for longer than a limit.
class StallWatchdog {
 public:
  explicit StallWatchdog(int64_t limit_ns) : limit_ns_(limit_ns) {}

  /// Record a sample taken |elapsed_ns| after the previous one. A negative
  /// |position| means the position could not be queried.
  /// @return true once the position has not advanced for the limit.
  bool Sample(int64_t position, int64_t elapsed_ns);

  bool stalled() const { return stalled_for_ns_ >= limit_ns_; }
  int64_t stalled_for_ns() const { return stalled_for_ns_; }

 private:
  int64_t limit_ns_;
  int64_t last_position_ = -1;
  int64_t stalled_for_ns_ = 0;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_STALL_WATCHDOG_H_
