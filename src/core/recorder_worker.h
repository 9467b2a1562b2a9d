// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_RECORDER_WORKER_H_
#define SNAPREEL_CORE_RECORDER_WORKER_H_

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

#include "core/app_settings.h"
#include "core/geometry.h"
#include "core/recording_session.h"
#include "core/subscription.h"

namespace snapreel {
namespace internal {

/// Always-resident recorder. Owns a thread with an ordered mailbox; session
/// start/stop requests are executed there one at a time.
class RecorderWorker {
 public:
  /// |session| is not owned and must outlive the worker.
  explicit RecorderWorker(RecordingSessionManager* session);
  ~RecorderWorker();

  RecorderWorker(const RecorderWorker&) = delete;
  RecorderWorker& operator=(const RecorderWorker&) = delete;

  /// Start the mailbox thread. No-op if already running.
  void Launch();

  /// Abort any session, drain nothing further and join. Idempotent.
  void Shutdown();

  /// Subscribe to the orchestrator's request channels. Replaces previous
  /// subscriptions.
  void Attach(EventChannel<SelectionRect, AppSettings>* start_channel,
              EventChannel<>* stop_channel);

  /// Fired on the worker thread once a session is recording.
  EventChannel<SelectionRect>& session_started() { return session_started_; }

  /// Fired on the worker thread with every terminal session result,
  /// including failed starts.
  EventChannel<SessionResult>& recording_finished() {
    return recording_finished_;
  }

  /// Queue a task. Tasks posted after Shutdown() are dropped.
  void Post(std::function<void()> task);

  /// Block until every task posted so far has run.
  void Flush();

  bool running() const;

 private:
  void ThreadFunc();
  void RunTask(const std::function<void()>& task);
  void DoStart(const SelectionRect& rect, const AppSettings& settings);
  void DoStop();

  RecordingSessionManager* session_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> mailbox_;
  bool running_ = false;
  bool busy_ = false;
  std::thread thread_;

  Subscription start_sub_;
  Subscription stop_sub_;
  EventChannel<SelectionRect> session_started_;
  EventChannel<SessionResult> recording_finished_;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_RECORDER_WORKER_H_
