// Copyright 2026 The snapreel Authors
//
// Interfaces the orchestration core needs from the host environment. The
// desktop app provides GTK/X11 implementations; tests provide fakes.

#ifndef SNAPREEL_CORE_PLATFORM_SERVICES_H_
#define SNAPREEL_CORE_PLATFORM_SERVICES_H_

#include <functional>
#include <memory>
#include <string>

#include "core/geometry.h"
#include "core/image.h"
#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

// Platform-neutral virtual-key codes (values match Win32 VK_F*).
static constexpr int kKeyF1 = 0x70;
static constexpr int kKeyF2 = 0x71;
static constexpr int kKeyF3 = 0x72;

// Hotkey modifier bits.
static constexpr int kModNone = 0;
static constexpr int kModAlt = 1 << 0;

/// What the host can do. Injected once at startup; the core branches on
/// these flags, never on the OS name.
struct PlatformCapabilities {
  bool system_audio_loopback = true;
  bool microphone_consent_required = false;
  bool input_passthrough = true;
  std::string native_container = "webm";
};

/// System-wide global hotkeys.
class IPlatformHotkey {
 public:
  using Handler = std::function<void(int hotkey_id)>;

  virtual ~IPlatformHotkey() = default;

  /// Register a global hotkey.
  /// @param hotkey_id  Application-defined identifier.
  /// @param key_code   kKeyF1..kKeyF3.
  /// @param modifiers  kModNone or kModAlt.
  /// @return false if the key is taken or cannot be grabbed.
  virtual bool Register(int hotkey_id, int key_code, int modifiers) = 0;

  virtual void Unregister(int hotkey_id) = 0;

  /// Unregister all hotkeys registered through this instance.
  virtual void UnregisterAll() = 0;

  /// Handler invoked on the main thread when a registered hotkey fires.
  virtual void SetHandler(Handler handler) = 0;

 protected:
  IPlatformHotkey() = default;

 private:
  IPlatformHotkey(const IPlatformHotkey&) = delete;
  IPlatformHotkey& operator=(const IPlatformHotkey&) = delete;
};

/// Persistent key/value settings.
class IPlatformSettings {
 public:
  virtual ~IPlatformSettings() = default;

  /// Read a 32-bit integer setting.  Returns true on success.
  virtual bool GetInt(const char* key, int* out_value) = 0;

  /// Write a 32-bit integer setting.  Returns true on success.
  virtual bool SetInt(const char* key, int value) = 0;

  /// Read a UTF-8 string setting.  Returns true on success.
  virtual bool GetString(const char* key, std::string* out_value) = 0;

  /// Write a UTF-8 string setting.  Returns true on success.
  virtual bool SetString(const char* key, const char* value) = 0;

 protected:
  IPlatformSettings() = default;

 private:
  IPlatformSettings(const IPlatformSettings&) = delete;
  IPlatformSettings& operator=(const IPlatformSettings&) = delete;
};

/// Transient, non-blocking notices.
class IPlatformNotifier {
 public:
  virtual ~IPlatformNotifier() = default;

  /// Show |message| near |origin| (screen coordinates), or centred on the
  /// primary display when |origin| is null.
  virtual void Notify(const std::string& message, const Point* origin) = 0;

 protected:
  IPlatformNotifier() = default;

 private:
  IPlatformNotifier(const IPlatformNotifier&) = delete;
  IPlatformNotifier& operator=(const IPlatformNotifier&) = delete;
};

class IPlatformClipboard {
 public:
  virtual ~IPlatformClipboard() = default;

  /// Put a BGRA8 image on the system clipboard.
  virtual bool WriteImage(const Image& image) = 0;

 protected:
  IPlatformClipboard() = default;

 private:
  IPlatformClipboard(const IPlatformClipboard&) = delete;
  IPlatformClipboard& operator=(const IPlatformClipboard&) = delete;
};

/// How the overlay paints behind the selection.
enum class BackdropStyle {
  kLive,    // Transparent overlay over the live desktop
  kFrozen,  // Opaque overlay showing a still taken when the overlay opened
};

/// The full-screen selection surface.
class IOverlayHost {
 public:
  virtual ~IOverlayHost() = default;

  virtual void ShowSelector(SnapReelCaptureMode mode, BackdropStyle style) = 0;

  /// Switch a record-mode overlay to recording controls around |rect|.
  virtual void ShowRecordingControls(const SelectionRect& rect) = 0;

  /// Hide and reset. No-op when hidden.
  virtual void Close() = 0;

  virtual bool IsVisible() const = 0;

 protected:
  IOverlayHost() = default;

 private:
  IOverlayHost(const IOverlayHost&) = delete;
  IOverlayHost& operator=(const IOverlayHost&) = delete;
};

/// Main-thread task queue.
class IScheduler {
 public:
  virtual ~IScheduler() = default;

  /// Run |task| on the main thread. Callable from any thread.
  virtual void Post(std::function<void()> task) = 0;

  /// Run |task| on the main thread after |delay_ms|.
  virtual void PostDelayed(int delay_ms, std::function<void()> task) = 0;

 protected:
  IScheduler() = default;

 private:
  IScheduler(const IScheduler&) = delete;
  IScheduler& operator=(const IScheduler&) = delete;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_PLATFORM_SERVICES_H_
