// Copyright 2026 The snapreel Authors

#include "core/recorder_worker.h"

#include <exception>
#include <utility>

#include "core/logger.h"

namespace snapreel {
namespace internal {

RecorderWorker::RecorderWorker(RecordingSessionManager* session)
    : session_(session) {
  session_->SetFaultCallback([this](SnapReelError) {
    // Runs on the compositor thread; the stop itself must not.
    Post([this]() { DoStop(); });
  });
}

RecorderWorker::~RecorderWorker() {
  Shutdown();
  session_->SetFaultCallback(nullptr);
}

void RecorderWorker::Launch() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_ = std::thread(&RecorderWorker::ThreadFunc, this);
  SNAPREEL_LOG_INFO("Recorder worker launched");
}

void RecorderWorker::Shutdown() {
  start_sub_.Unsubscribe();
  stop_sub_.Unsubscribe();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    running_ = false;
    mailbox_.clear();
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  session_->Abort();
  idle_cv_.notify_all();
  SNAPREEL_LOG_INFO("Recorder worker stopped");
}

bool RecorderWorker::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void RecorderWorker::Attach(
    EventChannel<SelectionRect, AppSettings>* start_channel,
    EventChannel<>* stop_channel) {
  start_sub_ = start_channel->Subscribe(
      [this](const SelectionRect& rect, const AppSettings& settings) {
        Post([this, rect, settings]() { DoStart(rect, settings); });
      });
  stop_sub_ = stop_channel->Subscribe([this]() {
    Post([this]() { DoStop(); });
  });
}

void RecorderWorker::Post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      SNAPREEL_LOG_WARN("Recorder worker not running, task dropped");
      return;
    }
    mailbox_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void RecorderWorker::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() {
    return !running_ || (mailbox_.empty() && !busy_);
  });
}

void RecorderWorker::ThreadFunc() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return !running_ || !mailbox_.empty(); });
      if (!running_) break;
      task = std::move(mailbox_.front());
      mailbox_.pop_front();
      busy_ = true;
    }
    RunTask(task);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}

void RecorderWorker::RunTask(const std::function<void()>& task) {
  try {
    task();
  } catch (const std::exception& e) {
    SNAPREEL_LOG_ERROR("Recorder task failed: {}", e.what());
    session_->Abort();
    SessionResult result;
    result.error = kSnapReelErrorUnknown;
    recording_finished_.Emit(result);
  }
}

void RecorderWorker::DoStart(const SelectionRect& rect,
                             const AppSettings& settings) {
  RecordingRequest request;
  request.rect = rect;
  request.settings = settings;

  SnapReelError err = session_->Start(request);
  if (err != kSnapReelOk) {
    SessionResult result;
    result.error = err;
    recording_finished_.Emit(result);
    return;
  }
  session_started_.Emit(rect);
}

void RecorderWorker::DoStop() {
  SessionResult result;
  if (!session_->Stop(&result)) return;  // Duplicate stop
  recording_finished_.Emit(result);
}

}  // namespace internal
}  // namespace snapreel
