// Copyright 2026 The snapreel Authors

#include "platform/linux/linux_notifier.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <algorithm>

namespace {

constexpr int kPointerOffset = 16;
constexpr int kPadding = 10;

}  // namespace

LinuxNotifier::~LinuxNotifier() { Dismiss(); }

void LinuxNotifier::Notify(const std::string& message,
                           const snapreel::internal::Point* origin) {
  Dismiss();

  toast_ = gtk_window_new(GTK_WINDOW_POPUP);
  gtk_window_set_type_hint(GTK_WINDOW(toast_),
                           GDK_WINDOW_TYPE_HINT_NOTIFICATION);
  gtk_window_set_keep_above(GTK_WINDOW(toast_), TRUE);
  gtk_window_set_accept_focus(GTK_WINDOW(toast_), FALSE);

  GtkWidget* label = gtk_label_new(message.c_str());
  gtk_widget_set_margin_start(label, kPadding);
  gtk_widget_set_margin_end(label, kPadding);
  gtk_widget_set_margin_top(label, kPadding / 2);
  gtk_widget_set_margin_bottom(label, kPadding / 2);
  gtk_container_add(GTK_CONTAINER(toast_), label);
  gtk_widget_show_all(toast_);

  int tw = 0, th = 0;
  gtk_window_get_size(GTK_WINDOW(toast_), &tw, &th);

  GdkDisplay* display = gdk_display_get_default();
  GdkMonitor* monitor = nullptr;
  if (origin) {
    monitor = gdk_display_get_monitor_at_point(display, origin->x, origin->y);
  } else {
    monitor = gdk_display_get_primary_monitor(display);
    if (!monitor) monitor = gdk_display_get_monitor(display, 0);
  }
  GdkRectangle area = {0, 0, tw, th};
  if (monitor) gdk_monitor_get_workarea(monitor, &area);

  int x = 0, y = 0;
  if (origin) {
    x = origin->x + kPointerOffset;
    y = origin->y + kPointerOffset;
  } else {
    x = area.x + (area.width - tw) / 2;
    y = area.y + (area.height - th) / 2;
  }
  // Keep the toast fully on screen.
  x = std::max(area.x, std::min(x, area.x + area.width - tw));
  y = std::max(area.y, std::min(y, area.y + area.height - th));
  gtk_window_move(GTK_WINDOW(toast_), x, y);

  timer_ = g_timeout_add(kToastDurationMs, OnExpire, this);
}

gboolean LinuxNotifier::OnExpire(gpointer data) {
  auto* self = static_cast<LinuxNotifier*>(data);
  self->timer_ = 0;
  self->Dismiss();
  return G_SOURCE_REMOVE;
}

void LinuxNotifier::Dismiss() {
  if (timer_) {
    g_source_remove(timer_);
    timer_ = 0;
  }
  if (toast_) {
    gtk_widget_destroy(toast_);
    toast_ = nullptr;
  }
}

#endif  // __linux__
