// Copyright 2026 The snapreel Authors

#include "platform/linux/x11_capture_backend.h"

#include <atomic>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <string>

#include <X11/Xlib.h>
#include <X11/Xutil.h>

#include "core/image.h"
#include "core/logger.h"

namespace snapreel {
namespace internal {

namespace {

std::unique_ptr<Image> XImageToImage(XImage* ximg) {
  if (!ximg) return nullptr;

  int w = ximg->width;
  int h = ximg->height;
  int stride = w * 4;
  std::vector<uint8_t> pixels(static_cast<size_t>(stride) * h);

  // Fast path: 32bpp little-endian with standard RGB masks (most common).
  // In-memory layout is already B G R pad, so copy and set alpha.
  if (ximg->bits_per_pixel == 32 && ximg->byte_order == LSBFirst &&
      ximg->red_mask == 0xFF0000 && ximg->green_mask == 0x00FF00 &&
      ximg->blue_mask == 0x0000FF) {
    for (int y = 0; y < h; ++y) {
      const uint8_t* src =
          reinterpret_cast<const uint8_t*>(ximg->data) +
          static_cast<ptrdiff_t>(y) * ximg->bytes_per_line;
      uint8_t* dst = pixels.data() + static_cast<ptrdiff_t>(y) * stride;
      std::memcpy(dst, src, static_cast<size_t>(w) * 4);
      for (int x = 0; x < w; ++x) dst[x * 4 + 3] = 0xFF;
    }
  } else {
    // Generic fallback via XGetPixel.
    for (int y = 0; y < h; ++y) {
      uint8_t* dst = pixels.data() + static_cast<ptrdiff_t>(y) * stride;
      for (int x = 0; x < w; ++x) {
        unsigned long px = XGetPixel(ximg, x, y);
        dst[x * 4 + 0] = static_cast<uint8_t>((px >> 0) & 0xFF);
        dst[x * 4 + 1] = static_cast<uint8_t>((px >> 8) & 0xFF);
        dst[x * 4 + 2] = static_cast<uint8_t>((px >> 16) & 0xFF);
        dst[x * 4 + 3] = 0xFF;
      }
    }
  }

  return Image::CreateFromData(w, h, stride, kSnapReelFormatBgra8,
                               std::move(pixels));
}

// Grab |region| of the root window; an empty region means all of it.
std::unique_ptr<Image> GrabRoot(Display* dpy, const PixelRect& region) {
  int scr = DefaultScreen(dpy);
  Window root = RootWindow(dpy, scr);
  int scr_w = DisplayWidth(dpy, scr);
  int scr_h = DisplayHeight(dpy, scr);

  int x = 0, y = 0, width = scr_w, height = scr_h;
  if (!region.empty()) {
    x = region.x;
    y = region.y;
    width = region.width;
    height = region.height;
    if (x < 0) { width += x; x = 0; }
    if (y < 0) { height += y; y = 0; }
    if (x + width > scr_w) width = scr_w - x;
    if (y + height > scr_h) height = scr_h - y;
    if (width <= 0 || height <= 0) return nullptr;
  }

  XImage* ximg = XGetImage(dpy, root, x, y, static_cast<unsigned>(width),
                           static_cast<unsigned>(height), AllPlanes, ZPixmap);
  if (!ximg) {
    SNAPREEL_LOG_ERROR("XGetImage failed for {}x{} at {},{}", width, height,
                       x, y);
    return nullptr;
  }
  auto img = XImageToImage(ximg);
  XDestroyImage(ximg);
  return img;
}

std::string SourceId(int screen) { return "screen:" + std::to_string(screen); }

// ---------------------------------------------------------------------------
// X11VideoTrack
// ---------------------------------------------------------------------------

/// Polls the root window on a private display connection.
class X11VideoTrack : public VideoTrack {
 public:
  explicit X11VideoTrack(Display* dpy) : dpy_(dpy) {}
  ~X11VideoTrack() override { Stop(); }

  bool IsLive() const override {
    return !stopped_.load(std::memory_order_acquire);
  }

  bool IsPaused() const override { return false; }

  std::unique_ptr<Image> ReadFrame() override {
    if (stopped_.load(std::memory_order_acquire)) return nullptr;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!dpy_) return nullptr;
    return GrabRoot(dpy_, PixelRect());
  }

  void Stop() override {
    stopped_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(mutex_);
    if (dpy_) {
      XCloseDisplay(dpy_);
      dpy_ = nullptr;
      SNAPREEL_LOG_DEBUG("X11 video track stopped");
    }
  }

 private:
  std::mutex mutex_;
  Display* dpy_;
  std::atomic<bool> stopped_{false};
};

}  // namespace

X11CaptureBackend::X11CaptureBackend() = default;
X11CaptureBackend::~X11CaptureBackend() { Shutdown(); }

bool X11CaptureBackend::Initialize() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_) return true;
  Display* dpy = XOpenDisplay(nullptr);
  if (!dpy) {
    SNAPREEL_LOG_ERROR("Failed to open X11 display");
    return false;
  }
  display_ = dpy;
  initialized_ = true;
  return true;
}

void X11CaptureBackend::Shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (display_) {
    XCloseDisplay(static_cast<Display*>(display_));
    display_ = nullptr;
  }
  initialized_ = false;
}

std::vector<CaptureSourceInfo> X11CaptureBackend::ListScreenSources() {
  std::vector<CaptureSourceInfo> sources;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) return sources;

  auto* dpy = static_cast<Display*>(display_);
  int scr = DefaultScreen(dpy);

  CaptureSourceInfo info;
  info.id = SourceId(scr);
  info.name = "Screen " + std::to_string(scr);
  info.width = DisplayWidth(dpy, scr);
  info.height = DisplayHeight(dpy, scr);
  sources.push_back(info);
  return sources;
}

std::unique_ptr<Image> X11CaptureBackend::GetStillFrame(
    const std::string& source_id, const PixelRect& region) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) return nullptr;
  auto* dpy = static_cast<Display*>(display_);
  if (source_id != SourceId(DefaultScreen(dpy))) {
    SNAPREEL_LOG_ERROR("Unknown capture source '{}'", source_id);
    return nullptr;
  }
  return GrabRoot(dpy, region);
}

std::unique_ptr<VideoTrack> X11CaptureBackend::OpenVideoTrack(
    const std::string& source_id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) return nullptr;
    if (source_id != SourceId(DefaultScreen(static_cast<Display*>(display_)))) {
      SNAPREEL_LOG_ERROR("Unknown capture source '{}'", source_id);
      return nullptr;
    }
  }
  Display* track_dpy = XOpenDisplay(nullptr);
  if (!track_dpy) {
    SNAPREEL_LOG_ERROR("Failed to open X11 display for video track");
    return nullptr;
  }
  return std::make_unique<X11VideoTrack>(track_dpy);
}

void X11CaptureBackend::SetScaleOverride(double scale) {
  std::lock_guard<std::mutex> lock(mutex_);
  scale_override_ = scale > 0.0 ? scale : 0.0;
}

// Caller holds mutex_.
double X11CaptureBackend::DetectScale() {
  if (scale_override_ > 0.0) return scale_override_;

  auto* dpy = static_cast<Display*>(display_);
  char* xdpi = XGetDefault(dpy, "Xft", "dpi");
  if (xdpi) {
    int dpi = std::atoi(xdpi);
    if (dpi > 0) return static_cast<double>(dpi) / 96.0;
  }

  const char* gdk_scale = std::getenv("GDK_SCALE");
  if (gdk_scale) {
    double scale = std::atof(gdk_scale);
    if (scale > 0.0) return scale;
  }
  return 1.0;
}

bool X11CaptureBackend::GetDisplayInfo(const std::string& source_id,
                                       DisplayInfo* out_info) {
  if (!out_info) return false;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!initialized_) return false;

  auto* dpy = static_cast<Display*>(display_);
  int scr = DefaultScreen(dpy);
  if (source_id != SourceId(scr)) return false;

  double scale = DetectScale();
  out_info->physical_width = DisplayWidth(dpy, scr);
  out_info->physical_height = DisplayHeight(dpy, scr);
  out_info->scale_factor = scale;
  out_info->logical_width =
      static_cast<int>(std::lround(out_info->physical_width / scale));
  out_info->logical_height =
      static_cast<int>(std::lround(out_info->physical_height / scale));
  return true;
}

// Factory function.
std::unique_ptr<CaptureBackend> CreatePlatformBackend() {
  return std::make_unique<X11CaptureBackend>();
}

}  // namespace internal
}  // namespace snapreel
