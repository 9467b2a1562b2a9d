// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_ORCHESTRATOR_H_
#define SNAPREEL_CORE_ORCHESTRATOR_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "core/app_settings.h"
#include "core/capture_backend.h"
#include "core/geometry.h"
#include "core/image.h"
#include "core/platform_services.h"
#include "core/recorder_worker.h"
#include "core/recording_session.h"
#include "core/session_registry.h"
#include "core/subscription.h"
#include "core/transcoder.h"
#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

/// Host services used by the orchestrator. None are owned. capture, overlay,
/// notifier and scheduler are required; the rest may be null.
struct OrchestratorServices {
  CaptureBackend* capture = nullptr;
  IOverlayHost* overlay = nullptr;
  IPlatformNotifier* notifier = nullptr;
  IScheduler* scheduler = nullptr;
  IPlatformClipboard* clipboard = nullptr;
  IPlatformHotkey* hotkey = nullptr;
  IPlatformSettings* settings_store = nullptr;
  Transcoder* transcoder = nullptr;
  /// Wall clock used for output names. Defaults to system_clock::now.
  std::function<std::chrono::system_clock::time_point()> clock;
};

/// Where a finished recording ended up.
struct RecordingOutput {
  SnapReelError error = kSnapReelOk;
  std::string native_path;      // Encoder container as written
  std::string final_path;       // Transcode target, or native_path
  bool transcode_pending = false;
};

/// (error, written file path or "") for still captures.
using CaptureDoneCallback =
    std::function<void(SnapReelError error, const std::string& path)>;

/// Main-thread coordinator: shortcuts, overlay, still output, recording
/// requests and recording output. All methods must run on the main thread.
class Orchestrator {
 public:
  /// Delay between hiding the overlay and grabbing the still.
  static constexpr int kCaptureSettleMs = 50;

  Orchestrator(const OrchestratorServices& services,
               const PlatformCapabilities& caps, const AppSettings& settings);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  /// Validate services, install the hotkey handler and register shortcuts.
  /// @return false if a required service is missing.
  bool Initialize();

  /// Unregister shortcuts and drop recorder subscriptions.
  void Shutdown();

  /// Wire the recorder both ways: it consumes start/stop requests, and its
  /// results are marshalled back onto the main thread.
  void AttachRecorder(RecorderWorker* worker);

  // -- Shortcuts --

  /// (Re)register the three shortcuts for the current keymap. Failures are
  /// reported as notices. @return number registered.
  int RegisterShortcuts();

  /// Switch keymap at runtime, persist it and re-register.
  void SetShortcutMode(SnapReelShortcutMode mode);

  void HandleShortcut(SnapReelShortcutAction action);

  /// Dispatch an IPlatformHotkey id.
  void HandleHotkey(int hotkey_id);

  // -- Selection / stills --

  /// Show the overlay for |mode|. Frozen still modes capture and publish the
  /// backdrop on init_screenshot.
  SnapReelError OpenSelector(SnapReelCaptureMode mode);

  /// Close the overlay, wait kCaptureSettleMs, then crop a fresh still and
  /// deliver it per |mode|. |done| runs on the main thread when finished.
  /// @return kSnapReelOk if the capture was scheduled.
  SnapReelError CaptureRegion(const SelectionRect& rect,
                              SnapReelCaptureMode mode,
                              const Point* pointer_origin,
                              CaptureDoneCallback done);

  /// Escape / right-click from the overlay.
  void CancelSelection();

  // -- Recording --

  SnapReelError StartRecording(const SelectionRect& rect);

  /// @return true if a stop or cancel was issued.
  bool StopRecording();

  /// Persist a finished session and optionally start transcoding.
  RecordingOutput SaveRecording(const SessionResult& result);

  // -- Misc --

  void OnSecondInstance();

  const AppSettings& settings() const { return settings_; }

  /// Replace settings and persist them. Keymap changes re-register.
  void UpdateSettings(const AppSettings& settings);

  const SessionRegistry& registry() const { return registry_; }
  const PlatformCapabilities& capabilities() const { return caps_; }

  // -- Channels --

  EventChannel<SelectionRect, AppSettings>& start_recording() {
    return start_recording_;
  }
  EventChannel<>& stop_recording() { return stop_recording_; }
  EventChannel<std::shared_ptr<const Image>>& init_screenshot() {
    return init_screenshot_;
  }
  EventChannel<>& clear_screenshot() { return clear_screenshot_; }

  static std::string AcceleratorName(SnapReelShortcutAction action,
                                     SnapReelShortcutMode mode);

 private:
  SnapReelError GrabFullStill(std::unique_ptr<Image>* out_still,
                              DisplayInfo* out_info);
  SnapReelError CaptureStillNow(const SelectionRect& rect,
                                SnapReelCaptureMode mode,
                                const AppSettings& settings,
                                std::string* out_path);
  void OnSessionStarted();
  void OnRecordingFinished(const SessionResult& result);
  void OnTranscodeDone(bool ok, const std::string& error,
                       const std::string& native_path,
                       const std::string& target_path);
  void Notify(const std::string& message, const Point* origin = nullptr);
  std::chrono::system_clock::time_point Now() const;

  OrchestratorServices services_;
  PlatformCapabilities caps_;
  AppSettings settings_;
  SessionRegistry registry_;

  EventChannel<SelectionRect, AppSettings> start_recording_;
  EventChannel<> stop_recording_;
  EventChannel<std::shared_ptr<const Image>> init_screenshot_;
  EventChannel<> clear_screenshot_;

  Subscription started_sub_;
  Subscription finished_sub_;

  // Guards callbacks that may arrive after destruction.
  std::shared_ptr<bool> alive_;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_ORCHESTRATOR_H_
