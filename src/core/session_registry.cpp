// Copyright 2026 The snapreel Authors

#include "core/session_registry.h"

#include "core/logger.h"

namespace snapreel {
namespace internal {

const char* RecordPhaseName(RecordPhase phase) {
  switch (phase) {
    case RecordPhase::kIdle:       return "idle";
    case RecordPhase::kSelecting:  return "selecting";
    case RecordPhase::kStarting:   return "starting";
    case RecordPhase::kRecording:  return "recording";
    case RecordPhase::kFinalizing: return "finalizing";
  }
  return "unknown";
}

bool SessionRegistry::Transition(RecordPhase to, bool allowed) {
  if (!allowed) {
    SNAPREEL_LOG_WARN("Registry: refused {} -> {}", RecordPhaseName(phase_),
                      RecordPhaseName(to));
    return false;
  }
  SNAPREEL_LOG_DEBUG("Registry: {} -> {}", RecordPhaseName(phase_),
                     RecordPhaseName(to));
  phase_ = to;
  return true;
}

bool SessionRegistry::BeginSelecting() {
  return Transition(RecordPhase::kSelecting, phase_ == RecordPhase::kIdle);
}

bool SessionRegistry::BeginStarting() {
  return Transition(RecordPhase::kStarting,
                    phase_ == RecordPhase::kIdle ||
                        phase_ == RecordPhase::kSelecting);
}

bool SessionRegistry::MarkRecording() {
  return Transition(RecordPhase::kRecording,
                    phase_ == RecordPhase::kStarting);
}

bool SessionRegistry::BeginFinalizing() {
  return Transition(RecordPhase::kFinalizing,
                    phase_ == RecordPhase::kStarting ||
                        phase_ == RecordPhase::kRecording);
}

void SessionRegistry::Reset() {
  if (phase_ != RecordPhase::kIdle) {
    SNAPREEL_LOG_DEBUG("Registry: {} -> idle (reset)", RecordPhaseName(phase_));
  }
  phase_ = RecordPhase::kIdle;
}

}  // namespace internal
}  // namespace snapreel
