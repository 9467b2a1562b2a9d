// Copyright 2026 The snapreel Authors
// Linux application: GtkApplication single instance, tray menu, wiring.

#ifndef SNAPREEL_APP_PLATFORM_LINUX_LINUX_APPLICATION_H_
#define SNAPREEL_APP_PLATFORM_LINUX_LINUX_APPLICATION_H_

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <memory>

#include <gtk/gtk.h>

#include "core/app_settings.h"
#include "core/audio_backend.h"
#include "core/orchestrator.h"
#include "core/platform_services.h"
#include "core/recorder_worker.h"
#include "core/recording_session.h"
#include "core/transcoder.h"
#include "platform/linux/glib_scheduler.h"
#include "platform/linux/gtk_clipboard.h"
#include "platform/linux/linux_capture_overlay.h"
#include "platform/linux/linux_notifier.h"
#include "platform/linux/x11_capture_backend.h"

class LinuxApplication {
 public:
  static LinuxApplication& instance();

  bool Init();
  int  Run(int argc, char** argv);
  void Shutdown();

  snapreel::internal::Orchestrator* orchestrator() const {
    return orchestrator_.get();
  }
  void Quit();

  // Tray menu actions.
  void SetShortcutMode(SnapReelShortcutMode mode);
  void SetAudioSource(SnapReelAudioSource source);
  void OpenSaveFolder();

 private:
  LinuxApplication() = default;

  static void OnStartup(GApplication* app, gpointer data);
  static void OnActivate(GApplication* app, gpointer data);

  bool BuildServices();
  void BuildTrayMenu();
  void RefreshMenuLabels();

  GtkApplication* gtk_app_ = nullptr;
  bool activated_ = false;
  bool startup_failed_ = false;

  std::unique_ptr<snapreel::internal::IPlatformSettings> settings_store_;
  snapreel::internal::AppSettings settings_;
  snapreel::internal::PlatformCapabilities caps_;

  std::unique_ptr<snapreel::internal::X11CaptureBackend> capture_;
  std::unique_ptr<snapreel::internal::AudioBackend> audio_;
  std::unique_ptr<snapreel::internal::Transcoder> transcoder_;
  std::unique_ptr<snapreel::internal::RecordingSessionManager> session_;
  std::unique_ptr<snapreel::internal::RecorderWorker> worker_;

  GlibScheduler scheduler_;
  LinuxNotifier notifier_;
  GtkClipboardWriter clipboard_;
  std::unique_ptr<snapreel::internal::IPlatformHotkey> hotkey_;
  CaptureOverlay overlay_;
  std::unique_ptr<snapreel::internal::Orchestrator> orchestrator_;

  GtkWidget* menu_ = nullptr;
  GtkWidget* copy_item_ = nullptr;
  GtkWidget* save_item_ = nullptr;
  GtkWidget* record_item_ = nullptr;
  GtkStatusIcon* icon_ = nullptr;
};

#endif  // __linux__
#endif  // SNAPREEL_APP_PLATFORM_LINUX_LINUX_APPLICATION_H_
