// Copyright 2026 The snapreel Authors
// IScheduler on the default GLib main context.

#ifndef SNAPREEL_APP_PLATFORM_LINUX_GLIB_SCHEDULER_H_
#define SNAPREEL_APP_PLATFORM_LINUX_GLIB_SCHEDULER_H_

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <functional>

#include "core/platform_services.h"

class GlibScheduler : public snapreel::internal::IScheduler {
 public:
  GlibScheduler() = default;

  void Post(std::function<void()> task) override;
  void PostDelayed(int delay_ms, std::function<void()> task) override;
};

#endif  // __linux__
#endif  // SNAPREEL_APP_PLATFORM_LINUX_GLIB_SCHEDULER_H_
