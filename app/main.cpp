// Copyright 2026 The snapreel Authors
//
// snapreel -- region screenshots and screen recording from the tray.
// Entry point: delegates to the platform Application singleton.

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

#include <gtk/gtk.h>

#include "core/ini_settings.h"
#include "core/logger.h"
#include "platform/linux/linux_application.h"

namespace {

// Last line of defence: record the failure before the runtime aborts.
[[noreturn]] void OnTerminate() {
  try {
    std::exception_ptr current = std::current_exception();
    if (current) std::rethrow_exception(current);
    SNAPREEL_LOG_FATAL("Terminated without an active exception");
  } catch (const std::exception& e) {
    SNAPREEL_LOG_FATAL("Unhandled exception: {}", e.what());
  } catch (...) {
    SNAPREEL_LOG_FATAL("Unhandled non-standard exception");
  }
  snapreel::internal::GetLogger()->flush();
  std::abort();
}

// Blocking error box for faults that end the process.
void ShowFatalDialog(const std::string& message) {
  if (!gtk_init_check(nullptr, nullptr)) return;
  GtkWidget* dialog = gtk_message_dialog_new(
      nullptr, GTK_DIALOG_MODAL, GTK_MESSAGE_ERROR, GTK_BUTTONS_OK,
      "snapreel stopped unexpectedly");
  gtk_message_dialog_format_secondary_text(
      GTK_MESSAGE_DIALOG(dialog), "%s\n\nDetails were written to %s",
      message.c_str(), snapreel::internal::DefaultCrashLogPath().c_str());
  gtk_window_set_title(GTK_WINDOW(dialog), "snapreel");
  gtk_dialog_run(GTK_DIALOG(dialog));
  gtk_widget_destroy(dialog);
}

}  // namespace

int main(int argc, char** argv) {
  std::set_terminate(OnTerminate);
  snapreel::internal::InitLogger();
  if (!snapreel::internal::EnableCrashLog(
          snapreel::internal::DefaultCrashLogPath())) {
    std::fprintf(stderr, "snapreel: crash log disabled\n");
  }

  auto& app = LinuxApplication::instance();
  int ret = 1;
  try {
    if (!app.Init()) return 1;
    ret = app.Run(argc, argv);
  } catch (const std::exception& e) {
    SNAPREEL_LOG_FATAL("Fatal error: {}", e.what());
    std::fprintf(stderr, "snapreel: fatal error: %s\n", e.what());
    snapreel::internal::GetLogger()->flush();
    ShowFatalDialog(e.what());
    ret = 1;
  }
  app.Shutdown();
  snapreel::internal::DisableCrashLog();
  return ret;
}
