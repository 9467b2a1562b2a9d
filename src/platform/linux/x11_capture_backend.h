// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_PLATFORM_LINUX_X11_CAPTURE_BACKEND_H_
#define SNAPREEL_PLATFORM_LINUX_X11_CAPTURE_BACKEND_H_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/capture_backend.h"
#include "core/image.h"

namespace snapreel {
namespace internal {

/// Linux capture backend using X11 (XGetImage on the root window).
///
/// The root window is the single source, id "screen:<n>". Video tracks open
/// their own display connection so they can be read from another thread.
class X11CaptureBackend : public CaptureBackend {
 public:
  X11CaptureBackend();
  ~X11CaptureBackend() override;

  bool Initialize() override;
  void Shutdown() override;

  std::vector<CaptureSourceInfo> ListScreenSources() override;
  std::unique_ptr<Image> GetStillFrame(const std::string& source_id,
                                       const PixelRect& region) override;
  std::unique_ptr<VideoTrack> OpenVideoTrack(
      const std::string& source_id) override;
  bool GetDisplayInfo(const std::string& source_id,
                      DisplayInfo* out_info) override;

  /// Use |scale| instead of Xft.dpi / GDK_SCALE. 0 clears the override.
  void SetScaleOverride(double scale);

 private:
  double DetectScale();

  std::mutex mutex_;
  bool initialized_ = false;
  void* display_ = nullptr;  // Display* from X11
  double scale_override_ = 0.0;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_PLATFORM_LINUX_X11_CAPTURE_BACKEND_H_
