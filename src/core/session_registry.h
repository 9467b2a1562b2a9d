// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_SESSION_REGISTRY_H_
#define SNAPREEL_CORE_SESSION_REGISTRY_H_

namespace snapreel {
namespace internal {

/// Lifecycle of the record flow as seen from the main thread.
enum class RecordPhase {
  kIdle,
  kSelecting,   // Record overlay open, nothing requested yet
  kStarting,    // Start requested, worker has not confirmed
  kRecording,
  kFinalizing,  // Stop requested, waiting for the result
};

const char* RecordPhaseName(RecordPhase phase);

/// Typed replacement for a bare "is recording" flag. Every transition is
/// checked; invalid ones are logged and refused. Main thread only.
class SessionRegistry {
 public:
  SessionRegistry() = default;

  RecordPhase phase() const { return phase_; }

  bool is_idle() const { return phase_ == RecordPhase::kIdle; }

  /// Starting, recording or finalizing.
  bool is_busy() const {
    return phase_ == RecordPhase::kStarting ||
           phase_ == RecordPhase::kRecording ||
           phase_ == RecordPhase::kFinalizing;
  }

  /// Idle -> Selecting.
  bool BeginSelecting();

  /// Idle | Selecting -> Starting.
  bool BeginStarting();

  /// Starting -> Recording.
  bool MarkRecording();

  /// Starting | Recording -> Finalizing.
  bool BeginFinalizing();

  /// Any -> Idle.
  void Reset();

 private:
  bool Transition(RecordPhase to, bool allowed);

  RecordPhase phase_ = RecordPhase::kIdle;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_SESSION_REGISTRY_H_
