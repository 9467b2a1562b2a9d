// Copyright 2026 The snapreel Authors
// Linux application implementation: single instance, tray menu, wiring.

#include "platform/linux/linux_application.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <string>

#include "core/encoder_backend.h"
#include "core/ini_settings.h"
#include "core/logger.h"
#include "core/output_naming.h"
#include "platform/linux/linux_hotkey.h"

using snapreel::internal::AppSettings;
using snapreel::internal::Orchestrator;
using snapreel::internal::OrchestratorServices;

static constexpr char kApplicationId[] = "io.github.snapreel";

// ========================================================================
// GTK tray menu callbacks
// ========================================================================

static void OnMenuCopy(GtkMenuItem* /*item*/, gpointer /*data*/) {
  auto* orch = LinuxApplication::instance().orchestrator();
  if (orch) orch->HandleShortcut(kSnapReelActionCopyRegion);
}

static void OnMenuSave(GtkMenuItem* /*item*/, gpointer /*data*/) {
  auto* orch = LinuxApplication::instance().orchestrator();
  if (orch) orch->HandleShortcut(kSnapReelActionSaveRegion);
}

static void OnMenuRecord(GtkMenuItem* /*item*/, gpointer /*data*/) {
  auto* orch = LinuxApplication::instance().orchestrator();
  if (orch) orch->HandleShortcut(kSnapReelActionToggleRecord);
}

static void OnMenuShortcutMode(GtkCheckMenuItem* item, gpointer data) {
  if (!gtk_check_menu_item_get_active(item)) return;
  LinuxApplication::instance().SetShortcutMode(
      static_cast<SnapReelShortcutMode>(GPOINTER_TO_INT(data)));
}

static void OnMenuAudioSource(GtkCheckMenuItem* item, gpointer data) {
  if (!gtk_check_menu_item_get_active(item)) return;
  LinuxApplication::instance().SetAudioSource(
      static_cast<SnapReelAudioSource>(GPOINTER_TO_INT(data)));
}

static void OnMenuOpenFolder(GtkMenuItem* /*item*/, gpointer /*data*/) {
  LinuxApplication::instance().OpenSaveFolder();
}

static void OnMenuAbout(GtkMenuItem* /*item*/, gpointer /*data*/) {
  GtkWidget* dialog = gtk_message_dialog_new(
      nullptr, GTK_DIALOG_MODAL, GTK_MESSAGE_INFO, GTK_BUTTONS_OK,
      "snapreel v%s\n\n"
      "Region screenshots and screen recording.",
      snapreel_version_string());
  gtk_dialog_run(GTK_DIALOG(dialog));
  gtk_widget_destroy(dialog);
}

static void OnMenuQuit(GtkMenuItem* /*item*/, gpointer /*data*/) {
  LinuxApplication::instance().Quit();
}

G_GNUC_BEGIN_IGNORE_DEPRECATIONS

static void OnStatusIconPopup(GtkStatusIcon* /*icon*/, guint button,
                              guint activate_time, gpointer menu) {
  gtk_menu_popup(GTK_MENU(menu), nullptr, nullptr,
                 gtk_status_icon_position_menu, nullptr,
                 button, activate_time);
}

G_GNUC_END_IGNORE_DEPRECATIONS

static GtkWidget* AppendItem(GtkWidget* menu, const char* label,
                             GCallback callback) {
  GtkWidget* item = gtk_menu_item_new_with_label(label);
  g_signal_connect(item, "activate", callback, nullptr);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu), item);
  return item;
}

static GtkWidget* AppendRadio(GtkWidget* menu, GSList** group,
                              const char* label, bool active, int value,
                              GCallback callback) {
  GtkWidget* item = gtk_radio_menu_item_new_with_label(*group, label);
  *group = gtk_radio_menu_item_get_group(GTK_RADIO_MENU_ITEM(item));
  gtk_check_menu_item_set_active(GTK_CHECK_MENU_ITEM(item), active);
  // Connect after setting the initial state.
  g_signal_connect(item, "toggled", callback, GINT_TO_POINTER(value));
  gtk_menu_shell_append(GTK_MENU_SHELL(menu), item);
  return item;
}

// ========================================================================
// LinuxApplication singleton
// ========================================================================

LinuxApplication& LinuxApplication::instance() {
  static LinuxApplication app;
  return app;
}

bool LinuxApplication::Init() {
  settings_store_ = snapreel::internal::CreatePlatformSettings();
  settings_ = snapreel::internal::LoadAppSettings(settings_store_.get());

  gtk_app_ = gtk_application_new(kApplicationId, G_APPLICATION_FLAGS_NONE);
  if (!gtk_app_) {
    SNAPREEL_LOG_FATAL("gtk_application_new failed");
    return false;
  }
  g_signal_connect(gtk_app_, "startup", G_CALLBACK(OnStartup), this);
  g_signal_connect(gtk_app_, "activate", G_CALLBACK(OnActivate), this);
  return true;
}

int LinuxApplication::Run(int argc, char** argv) {
  // Returns immediately in a second instance after activating the primary.
  int status = g_application_run(G_APPLICATION(gtk_app_), argc, argv);
  return startup_failed_ ? 1 : status;
}

void LinuxApplication::Quit() {
  overlay_.Close();
  if (gtk_app_) g_application_quit(G_APPLICATION(gtk_app_));
}

void LinuxApplication::Shutdown() {
  if (orchestrator_) orchestrator_->Shutdown();
  overlay_.Unbind();
  overlay_.Close();
  if (worker_) worker_->Shutdown();
  orchestrator_.reset();
  worker_.reset();
  session_.reset();
  hotkey_.reset();
  if (capture_) capture_->Shutdown();

  if (icon_) {
    g_object_unref(icon_);
    icon_ = nullptr;
  }
  if (gtk_app_) {
    g_object_unref(gtk_app_);
    gtk_app_ = nullptr;
  }
  SNAPREEL_LOG_INFO("Exiting");
}

// Runs in the primary instance only.
void LinuxApplication::OnStartup(GApplication* app, gpointer data) {
  auto* self = static_cast<LinuxApplication*>(data);
  if (!self->BuildServices()) {
    SNAPREEL_LOG_FATAL("Startup failed");
    self->startup_failed_ = true;
    return;
  }
  self->BuildTrayMenu();
  // Stay resident without a visible window.
  g_application_hold(app);
}

void LinuxApplication::OnActivate(GApplication* /*app*/, gpointer data) {
  auto* self = static_cast<LinuxApplication*>(data);
  if (!self->activated_) {
    self->activated_ = true;
    return;
  }
  if (self->orchestrator_) self->orchestrator_->OnSecondInstance();
}

bool LinuxApplication::BuildServices() {
  capture_ = std::make_unique<snapreel::internal::X11CaptureBackend>();
  if (!capture_->Initialize()) {
    SNAPREEL_LOG_ERROR("X11 capture backend unavailable");
    return false;
  }
  GdkDisplay* display = gdk_display_get_default();
  GdkMonitor* monitor = display ? gdk_display_get_primary_monitor(display)
                                : nullptr;
  if (monitor && gdk_monitor_get_scale_factor(monitor) > 1) {
    capture_->SetScaleOverride(gdk_monitor_get_scale_factor(monitor));
  }

  audio_ = snapreel::internal::CreatePlatformAudioBackend();
  transcoder_ = snapreel::internal::CreatePlatformTranscoder();

  caps_ = snapreel::internal::PlatformCapabilities();
  caps_.system_audio_loopback =
      audio_ && audio_->IsSupported(kSnapReelAudioSystem);

  session_ = std::make_unique<snapreel::internal::RecordingSessionManager>(
      capture_.get(), audio_.get(), &snapreel::internal::CreatePlatformEncoder,
      caps_);
  worker_ = std::make_unique<snapreel::internal::RecorderWorker>(session_.get());
  hotkey_ = std::make_unique<LinuxPlatformHotkey>();

  OrchestratorServices services;
  services.capture = capture_.get();
  services.overlay = &overlay_;
  services.notifier = &notifier_;
  services.scheduler = &scheduler_;
  services.clipboard = &clipboard_;
  services.hotkey = hotkey_.get();
  services.settings_store = settings_store_.get();
  services.transcoder = transcoder_.get();

  orchestrator_ = std::make_unique<Orchestrator>(services, caps_, settings_);
  if (!orchestrator_->Initialize()) return false;

  worker_->Launch();
  orchestrator_->AttachRecorder(worker_.get());
  overlay_.Bind(orchestrator_.get());

  SNAPREEL_LOG_INFO("snapreel v{} ready ({}/{}/{})",
                    snapreel_version_string(),
                    Orchestrator::AcceleratorName(kSnapReelActionCopyRegion,
                                                  settings_.shortcut_mode),
                    Orchestrator::AcceleratorName(kSnapReelActionSaveRegion,
                                                  settings_.shortcut_mode),
                    Orchestrator::AcceleratorName(kSnapReelActionToggleRecord,
                                                  settings_.shortcut_mode));
  return true;
}

void LinuxApplication::BuildTrayMenu() {
  const AppSettings& s = orchestrator_->settings();
  menu_ = gtk_menu_new();

  copy_item_ = AppendItem(menu_, "", G_CALLBACK(OnMenuCopy));
  save_item_ = AppendItem(menu_, "", G_CALLBACK(OnMenuSave));
  record_item_ = AppendItem(menu_, "", G_CALLBACK(OnMenuRecord));
  RefreshMenuLabels();

  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), gtk_separator_menu_item_new());

  // Shortcut mode submenu.
  GtkWidget* keys_menu = gtk_menu_new();
  GSList* keys_group = nullptr;
  AppendRadio(keys_menu, &keys_group, "Standard (F1/F2/F3)",
              s.shortcut_mode == kSnapReelShortcutStandard,
              kSnapReelShortcutStandard, G_CALLBACK(OnMenuShortcutMode));
  AppendRadio(keys_menu, &keys_group, "Alternative (Alt+F1/F2/F3)",
              s.shortcut_mode == kSnapReelShortcutAlternative,
              kSnapReelShortcutAlternative, G_CALLBACK(OnMenuShortcutMode));
  GtkWidget* keys_item = gtk_menu_item_new_with_label("Shortcuts");
  gtk_menu_item_set_submenu(GTK_MENU_ITEM(keys_item), keys_menu);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), keys_item);

  // Audio source submenu.
  GtkWidget* audio_menu = gtk_menu_new();
  GSList* audio_group = nullptr;
  AppendRadio(audio_menu, &audio_group, "No audio",
              s.audio_source == kSnapReelAudioNone, kSnapReelAudioNone,
              G_CALLBACK(OnMenuAudioSource));
  GtkWidget* system_item = AppendRadio(
      audio_menu, &audio_group, "System audio",
      s.audio_source == kSnapReelAudioSystem, kSnapReelAudioSystem,
      G_CALLBACK(OnMenuAudioSource));
  gtk_widget_set_sensitive(system_item, caps_.system_audio_loopback);
  AppendRadio(audio_menu, &audio_group, "Microphone",
              s.audio_source == kSnapReelAudioMicrophone,
              kSnapReelAudioMicrophone, G_CALLBACK(OnMenuAudioSource));
  GtkWidget* audio_item = gtk_menu_item_new_with_label("Audio");
  gtk_menu_item_set_submenu(GTK_MENU_ITEM(audio_item), audio_menu);
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), audio_item);

  AppendItem(menu_, "Open Save Folder", G_CALLBACK(OnMenuOpenFolder));
  gtk_menu_shell_append(GTK_MENU_SHELL(menu_), gtk_separator_menu_item_new());
  AppendItem(menu_, "About", G_CALLBACK(OnMenuAbout));
  AppendItem(menu_, "Quit", G_CALLBACK(OnMenuQuit));
  gtk_widget_show_all(menu_);

  G_GNUC_BEGIN_IGNORE_DEPRECATIONS
  icon_ = gtk_status_icon_new_from_icon_name("camera-video");
  gtk_status_icon_set_tooltip_text(icon_, "snapreel");
  gtk_status_icon_set_visible(icon_, TRUE);
  g_signal_connect(icon_, "popup-menu", G_CALLBACK(OnStatusIconPopup), menu_);
  G_GNUC_END_IGNORE_DEPRECATIONS
}

void LinuxApplication::RefreshMenuLabels() {
  SnapReelShortcutMode mode = orchestrator_->settings().shortcut_mode;
  auto label = [mode](const char* text, SnapReelShortcutAction action) {
    return std::string(text) + "  (" +
           Orchestrator::AcceleratorName(action, mode) + ")";
  };
  gtk_menu_item_set_label(
      GTK_MENU_ITEM(copy_item_),
      label("Copy Region", kSnapReelActionCopyRegion).c_str());
  gtk_menu_item_set_label(
      GTK_MENU_ITEM(save_item_),
      label("Save Region", kSnapReelActionSaveRegion).c_str());
  gtk_menu_item_set_label(
      GTK_MENU_ITEM(record_item_),
      label("Record / Stop", kSnapReelActionToggleRecord).c_str());
}

void LinuxApplication::SetShortcutMode(SnapReelShortcutMode mode) {
  if (!orchestrator_ || orchestrator_->settings().shortcut_mode == mode) return;
  orchestrator_->SetShortcutMode(mode);
  RefreshMenuLabels();
}

void LinuxApplication::SetAudioSource(SnapReelAudioSource source) {
  if (!orchestrator_) return;
  AppSettings s = orchestrator_->settings();
  if (s.audio_source == source) return;
  s.audio_source = source;
  orchestrator_->UpdateSettings(s);
}

void LinuxApplication::OpenSaveFolder() {
  if (!orchestrator_) return;
  const std::string& path = orchestrator_->settings().save_path;
  if (!snapreel::internal::EnsureDirectory(path)) {
    notifier_.Notify("Save folder unavailable", nullptr);
    return;
  }
  GError* error = nullptr;
  gchar* uri = g_filename_to_uri(path.c_str(), nullptr, &error);
  if (uri) {
    if (!g_app_info_launch_default_for_uri(uri, nullptr, &error)) {
      SNAPREEL_LOG_WARN("Cannot open {}: {}", path,
                        error ? error->message : "unknown");
    }
    g_free(uri);
  }
  if (error) g_error_free(error);
}

#endif  // __linux__
