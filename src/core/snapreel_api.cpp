// Copyright 2026 The snapreel Authors
//
// C API entry points.

#include "snapreel/snapreel.h"

#include "core/callback_sink.h"
#include "core/logger.h"

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

const char* snapreel_version_string(void) {
  return SNAPREEL_VERSION_STRING;
}

int snapreel_version_major(void) { return SNAPREEL_VERSION_MAJOR; }
int snapreel_version_minor(void) { return SNAPREEL_VERSION_MINOR; }
int snapreel_version_patch(void) { return SNAPREEL_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

const char* snapreel_error_string(SnapReelError error) {
  switch (error) {
    case kSnapReelOk:                      return "ok";
    case kSnapReelErrorNotInitialized:     return "not initialized";
    case kSnapReelErrorInvalidParam:       return "invalid parameter";
    case kSnapReelErrorNoCaptureSource:    return "no screen source";
    case kSnapReelErrorPermissionDenied:   return "permission denied";
    case kSnapReelErrorAcquisitionFailed:  return "source acquisition failed";
    case kSnapReelErrorEncodingFailed:     return "encoding failed";
    case kSnapReelErrorEmptyOutput:        return "empty data";
    case kSnapReelErrorWriteFailed:        return "file write failed";
    case kSnapReelErrorTranscodeFailed:    return "conversion failed";
    case kSnapReelErrorRecordInProgress:   return "recording in progress";
    case kSnapReelErrorClipboardFailed:    return "clipboard write failed";
    case kSnapReelErrorUnknown:            return "unknown error";
  }
  return "unknown error";
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void snapreel_set_log_level(SnapReelLogLevel level) {
  snapreel::internal::SetLogLevel(level);
}

void snapreel_set_log_callback(snapreel_log_callback_t callback,
                               void* userdata) {
  auto sink = snapreel::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void snapreel_log(SnapReelLogLevel level, const char* message) {
  if (!message) return;
  auto logger = snapreel::internal::GetLogger();
  if (logger) {
    logger->log(snapreel::internal::ToSpdlogLevel(level), "{}", message);
  }
}
