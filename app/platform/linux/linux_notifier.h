// Copyright 2026 The snapreel Authors
// Short-lived toast popups (GTK3).

#ifndef SNAPREEL_APP_PLATFORM_LINUX_LINUX_NOTIFIER_H_
#define SNAPREEL_APP_PLATFORM_LINUX_LINUX_NOTIFIER_H_

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <string>

#include <gtk/gtk.h>

#include "core/platform_services.h"

/// One toast at a time; a new notice replaces the visible one.
class LinuxNotifier : public snapreel::internal::IPlatformNotifier {
 public:
  static constexpr guint kToastDurationMs = 800;

  LinuxNotifier() = default;
  ~LinuxNotifier() override;

  void Notify(const std::string& message,
              const snapreel::internal::Point* origin) override;

 private:
  static gboolean OnExpire(gpointer data);
  void Dismiss();

  GtkWidget* toast_ = nullptr;
  guint timer_ = 0;
};

#endif  // __linux__
#endif  // SNAPREEL_APP_PLATFORM_LINUX_LINUX_NOTIFIER_H_
