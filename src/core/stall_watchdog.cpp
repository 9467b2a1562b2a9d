// Copyright 2026 The snapreel Authors

#include "core/stall_watchdog.h"

namespace snapreel {
namespace internal {

bool StallWatchdog::Sample(int64_t position, int64_t elapsed_ns) {
  if (position >= 0 && position > last_position_) {
    last_position_ = position;
    stalled_for_ns_ = 0;
  } else if (elapsed_ns > 0) {
    stalled_for_ns_ += elapsed_ns;
  }
  return stalled();
}

}  // namespace internal
}  // namespace snapreel
