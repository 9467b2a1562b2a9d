// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_CAPTURE_BACKEND_H_
#define SNAPREEL_CORE_CAPTURE_BACKEND_H_

#include <memory>
#include <string>
#include <vector>

#include "core/geometry.h"
#include "core/image.h"
#include "core/media_track.h"

namespace snapreel {
namespace internal {

/// A capturable screen.
struct CaptureSourceInfo {
  std::string id;
  std::string name;
  int width = 0;    // Physical pixels
  int height = 0;
  std::shared_ptr<const Image> thumbnail;  // May be null
};

/// Logical and physical geometry of the display behind a source.
struct DisplayInfo {
  int logical_width = 0;
  int logical_height = 0;
  int physical_width = 0;
  int physical_height = 0;
  double scale_factor = 1.0;  // physical / logical
};

/// Abstract interface for platform-specific screen capture backends.
///
/// Only the implementation for the current build platform is compiled.
class CaptureBackend {
 public:
  virtual ~CaptureBackend() = default;

  // Non-copyable.
  CaptureBackend(const CaptureBackend&) = delete;
  CaptureBackend& operator=(const CaptureBackend&) = delete;

  /// Initialize the capture backend. Must be called before any capture
  /// operations.
  /// @return true on success.
  virtual bool Initialize() = 0;

  /// Shut down and release platform resources.
  virtual void Shutdown() = 0;

  /// Enumerate screens. An empty list means nothing can be captured.
  virtual std::vector<CaptureSourceInfo> ListScreenSources() = 0;

  /// Grab a still at native resolution. |region| is in physical pixels;
  /// an empty region means the whole display.
  virtual std::unique_ptr<Image> GetStillFrame(const std::string& source_id,
                                               const PixelRect& region) = 0;

  /// Open a live video track for the given source.
  virtual std::unique_ptr<VideoTrack> OpenVideoTrack(
      const std::string& source_id) = 0;

  /// Fill |out_info| with the display geometry behind |source_id|.
  virtual bool GetDisplayInfo(const std::string& source_id,
                              DisplayInfo* out_info) = 0;

 protected:
  CaptureBackend() = default;
};

/// Factory function implemented per-platform (one per build target).
/// Defined in platform/<os>/xxx_capture_backend.cpp.
std::unique_ptr<CaptureBackend> CreatePlatformBackend();

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_CAPTURE_BACKEND_H_
