// Copyright 2026 The snapreel Authors
// Linux implementation of IPlatformHotkey using X11 XGrabKey.

#include "platform/linux/linux_hotkey.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <utility>

#include <X11/keysym.h>

#include "core/logger.h"

using snapreel::internal::kModAlt;

namespace {

constexpr guint kPollIntervalMs = 50;

// Lock-key combinations grabbed alongside each hotkey so NumLock/CapsLock
// do not defeat it.
const unsigned int kLockMasks[] = {0, Mod2Mask, LockMask, Mod2Mask | LockMask};

// Modifiers that distinguish one hotkey from another.
constexpr unsigned int kSignificantMods =
    ShiftMask | ControlMask | Mod1Mask | Mod4Mask;

// Map platform-neutral VK_F* codes to X11 keysyms.
// VK_F1 = 0x70 ... VK_F12 = 0x7B (same values as Windows).
KeySym VKToX11Keysym(int vk) {
  if (vk >= 0x70 && vk <= 0x7B) return XK_F1 + (vk - 0x70);
  return static_cast<KeySym>(vk);
}

// XGrabKey reports a taken key asynchronously as BadAccess.
bool g_grab_failed = false;

int GrabErrorHandler(Display* /*dpy*/, XErrorEvent* ev) {
  if (ev->error_code == BadAccess) g_grab_failed = true;
  return 0;
}

}  // namespace

LinuxPlatformHotkey::LinuxPlatformHotkey() {
  dpy_ = XOpenDisplay(nullptr);
  if (!dpy_) {
    SNAPREEL_LOG_ERROR("Cannot open X display for hotkeys");
    return;
  }
  poll_source_ = g_timeout_add(kPollIntervalMs, OnPoll, this);
}

LinuxPlatformHotkey::~LinuxPlatformHotkey() {
  if (poll_source_) g_source_remove(poll_source_);
  UnregisterAll();
  if (dpy_) XCloseDisplay(dpy_);
}

bool LinuxPlatformHotkey::Register(int hotkey_id, int key_code,
                                   int modifiers) {
  if (!dpy_) return false;

  KeyCode kc = XKeysymToKeycode(dpy_, VKToX11Keysym(key_code));
  if (kc == 0) {
    SNAPREEL_LOG_WARN("Unknown keycode for VK 0x{:X}", key_code);
    return false;
  }
  const unsigned int mask = (modifiers & kModAlt) ? Mod1Mask : 0;

  Window root = DefaultRootWindow(dpy_);
  XSync(dpy_, False);
  g_grab_failed = false;
  XErrorHandler previous = XSetErrorHandler(GrabErrorHandler);
  for (unsigned int lock : kLockMasks) {
    XGrabKey(dpy_, kc, mask | lock, root, True, GrabModeAsync,
             GrabModeAsync);
  }
  XSync(dpy_, False);
  XSetErrorHandler(previous);

  HotkeyEntry entry{hotkey_id, kc, mask};
  if (g_grab_failed) {
    // Release whichever lock variants did succeed.
    Ungrab(entry);
    XFlush(dpy_);
    return false;
  }
  entries_.push_back(entry);
  return true;
}

void LinuxPlatformHotkey::Unregister(int hotkey_id) {
  if (!dpy_) return;
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (it->id == hotkey_id) {
      Ungrab(*it);
      XFlush(dpy_);
      entries_.erase(it);
      return;
    }
  }
}

void LinuxPlatformHotkey::UnregisterAll() {
  if (!dpy_) return;
  for (const auto& e : entries_) Ungrab(e);
  XFlush(dpy_);
  entries_.clear();
}

void LinuxPlatformHotkey::SetHandler(Handler handler) {
  handler_ = std::move(handler);
}

void LinuxPlatformHotkey::Ungrab(const HotkeyEntry& entry) {
  Window root = DefaultRootWindow(dpy_);
  for (unsigned int lock : kLockMasks) {
    XUngrabKey(dpy_, entry.keycode, entry.mask | lock, root);
  }
}

gboolean LinuxPlatformHotkey::OnPoll(gpointer data) {
  auto* self = static_cast<LinuxPlatformHotkey*>(data);
  if (!self->dpy_) return G_SOURCE_CONTINUE;

  while (XPending(self->dpy_)) {
    XEvent ev;
    XNextEvent(self->dpy_, &ev);
    if (ev.type != KeyPress) continue;

    const unsigned int mods = ev.xkey.state & kSignificantMods;
    for (const auto& e : self->entries_) {
      if (e.keycode == ev.xkey.keycode && e.mask == mods) {
        if (self->handler_) self->handler_(e.id);
        break;
      }
    }
  }
  return G_SOURCE_CONTINUE;
}

#endif  // __linux__
