// Copyright 2026 The snapreel Authors

#include "platform/linux/glib_scheduler.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <exception>
#include <utility>

#include <glib.h>

#include "core/logger.h"

namespace {

using Task = std::function<void()>;

gboolean RunTask(gpointer data) {
  auto* task = static_cast<Task*>(data);
  try {
    (*task)();
  } catch (const std::exception& e) {
    SNAPREEL_LOG_ERROR("Main-thread task threw: {}", e.what());
  }
  return G_SOURCE_REMOVE;
}

void DeleteTask(gpointer data) { delete static_cast<Task*>(data); }

}  // namespace

// g_idle_add / g_timeout_add are safe to call from any thread; the task
// runs on the thread iterating the default context.
void GlibScheduler::Post(std::function<void()> task) {
  if (!task) return;
  g_idle_add_full(G_PRIORITY_DEFAULT, RunTask, new Task(std::move(task)),
                  DeleteTask);
}

void GlibScheduler::PostDelayed(int delay_ms, std::function<void()> task) {
  if (!task) return;
  g_timeout_add_full(G_PRIORITY_DEFAULT,
                     static_cast<guint>(delay_ms < 0 ? 0 : delay_ms), RunTask,
                     new Task(std::move(task)), DeleteTask);
}

#endif  // __linux__
