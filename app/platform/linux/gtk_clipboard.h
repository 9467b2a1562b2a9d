// Copyright 2026 The snapreel Authors
// IPlatformClipboard via GtkClipboard.

#ifndef SNAPREEL_APP_PLATFORM_LINUX_GTK_CLIPBOARD_H_
#define SNAPREEL_APP_PLATFORM_LINUX_GTK_CLIPBOARD_H_

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include "core/platform_services.h"

class GtkClipboardWriter : public snapreel::internal::IPlatformClipboard {
 public:
  GtkClipboardWriter() = default;

  bool WriteImage(const snapreel::internal::Image& image) override;
};

#endif  // __linux__
#endif  // SNAPREEL_APP_PLATFORM_LINUX_GTK_CLIPBOARD_H_
