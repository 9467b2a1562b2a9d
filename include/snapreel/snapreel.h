// Copyright 2026 The snapreel Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef SNAPREEL_SNAPREEL_H_
#define SNAPREEL_SNAPREEL_H_

#include <stddef.h>
#include <stdint.h>

#include "snapreel/version.h"

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(__GNUC__) || defined(__clang__)
#define SNAPREEL_API __attribute__((visibility("default")))
#else
#define SNAPREEL_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "snapreel/version.h"

// ---------------------------------------------------------------------------
// Thread safety
// ---------------------------------------------------------------------------
//
//   - snapreel_set_log_level() and snapreel_set_log_callback() are
//     process-global and internally synchronized.
//   - snapreel_version_*() and snapreel_error_string() are stateless and safe
//     to call from any thread at any time.
//

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by snapreel functions.
typedef enum SnapReelError {
  kSnapReelOk = 0,
  kSnapReelErrorNotInitialized = -1,
  kSnapReelErrorInvalidParam = -2,
  kSnapReelErrorNoCaptureSource = -3,     ///< No screen source enumerated
  kSnapReelErrorPermissionDenied = -4,    ///< Screen/mic/audio access denied
  kSnapReelErrorAcquisitionFailed = -5,   ///< A source could not be opened
  kSnapReelErrorEncodingFailed = -6,
  kSnapReelErrorEmptyOutput = -7,         ///< Recording produced zero bytes
  kSnapReelErrorWriteFailed = -8,
  kSnapReelErrorTranscodeFailed = -9,     ///< Native file is kept
  kSnapReelErrorRecordInProgress = -10,   ///< A recording is already active
  kSnapReelErrorClipboardFailed = -11,
  kSnapReelErrorUnknown = -99,
} SnapReelError;

/// Log severity levels for the internal logging system.
typedef enum SnapReelLogLevel {
  kSnapReelLogTrace = 0,   ///< Very detailed diagnostic info
  kSnapReelLogDebug = 1,   ///< Debug-level messages
  kSnapReelLogInfo = 2,    ///< Informational messages (default)
  kSnapReelLogWarn = 3,    ///< Warnings
  kSnapReelLogError = 4,   ///< Errors
  kSnapReelLogFatal = 5,   ///< Fatal / critical errors
} SnapReelLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to snapreel_set_log_callback.
typedef void (*snapreel_log_callback_t)(SnapReelLogLevel level,
                                        const char* message,
                                        void* userdata);

/// Pixel format of captured image data.
typedef enum SnapReelPixelFormat {
  kSnapReelFormatBgra8 = 0,   ///< B8G8R8A8 (default)
  kSnapReelFormatRgba8 = 1,   ///< R8G8B8A8
} SnapReelPixelFormat;

/// Still image output format.
typedef enum SnapReelImageFormat {
  kSnapReelImagePng = 0,
  kSnapReelImageJpeg = 1,
} SnapReelImageFormat;

/// Final container of a saved recording.
typedef enum SnapReelVideoFormat {
  kSnapReelVideoWebm = 0,   ///< Native encoder container
  kSnapReelVideoMp4 = 1,    ///< Transcoded after recording
} SnapReelVideoFormat;

/// Audio mixed into a recording.
typedef enum SnapReelAudioSource {
  kSnapReelAudioNone = 0,
  kSnapReelAudioSystem = 1,       ///< Desktop loopback
  kSnapReelAudioMicrophone = 2,
} SnapReelAudioSource;

/// What the selection overlay does with a confirmed region.
typedef enum SnapReelCaptureMode {
  kSnapReelModeClipboard = 0,
  kSnapReelModeFile = 1,
  kSnapReelModeRecord = 2,
} SnapReelCaptureMode;

/// Global shortcut keymap.
typedef enum SnapReelShortcutMode {
  kSnapReelShortcutStandard = 0,      ///< F1 / F2 / F3
  kSnapReelShortcutAlternative = 1,   ///< Alt+F1 / Alt+F2 / Alt+F3
} SnapReelShortcutMode;

/// Actions bound to global shortcuts.
typedef enum SnapReelShortcutAction {
  kSnapReelActionCopyRegion = 0,
  kSnapReelActionSaveRegion = 1,
  kSnapReelActionToggleRecord = 2,
} SnapReelShortcutAction;

/// Rectangle in screen coordinates.
typedef struct SnapReelRect {
  int x;
  int y;
  int width;
  int height;
} SnapReelRect;

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

/// Get the version string (e.g. "1.0.0").
SNAPREEL_API const char* snapreel_version_string(void);

/// Get the major version number.
SNAPREEL_API int snapreel_version_major(void);

/// Get the minor version number.
SNAPREEL_API int snapreel_version_minor(void);

/// Get the patch version number.
SNAPREEL_API int snapreel_version_patch(void);

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

/// Human-readable description of an error code. Never returns NULL.
SNAPREEL_API const char* snapreel_error_string(SnapReelError error);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the minimum log level. Messages below this level are discarded.
/// Default level is kSnapReelLogInfo.
SNAPREEL_API void snapreel_set_log_level(SnapReelLogLevel level);

/// Set a user-defined log callback.
///
/// When a callback is registered, all log messages (at or above the current
/// level) are forwarded to the callback in addition to the default stderr
/// output.  Pass NULL as @p callback to unregister a previous callback.
SNAPREEL_API void snapreel_set_log_callback(snapreel_log_callback_t callback,
                                            void* userdata);

/// Emit a log message at the given level through the snapreel logging system.
SNAPREEL_API void snapreel_log(SnapReelLogLevel level, const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // SNAPREEL_SNAPREEL_H_
