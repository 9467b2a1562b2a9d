// Copyright 2026 The snapreel Authors
// Linux implementation of IPlatformHotkey using X11 XGrabKey.

#ifndef SNAPREEL_APP_PLATFORM_LINUX_LINUX_HOTKEY_H_
#define SNAPREEL_APP_PLATFORM_LINUX_LINUX_HOTKEY_H_

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <vector>

#include <glib.h>
#include <X11/Xlib.h>

#include "core/platform_services.h"

/// Grabs keys on the root window of a private display connection and polls
/// it from the GLib main loop every 50 ms.
class LinuxPlatformHotkey : public snapreel::internal::IPlatformHotkey {
 public:
  LinuxPlatformHotkey();
  ~LinuxPlatformHotkey() override;

  bool Register(int hotkey_id, int key_code, int modifiers) override;
  void Unregister(int hotkey_id) override;
  void UnregisterAll() override;
  void SetHandler(Handler handler) override;

 private:
  struct HotkeyEntry {
    int id;
    KeyCode keycode;
    unsigned int mask;
  };

  static gboolean OnPoll(gpointer data);
  void Ungrab(const HotkeyEntry& entry);

  Display* dpy_ = nullptr;
  std::vector<HotkeyEntry> entries_;
  Handler handler_;
  guint poll_source_ = 0;
};

#endif  // __linux__
#endif  // SNAPREEL_APP_PLATFORM_LINUX_LINUX_HOTKEY_H_
