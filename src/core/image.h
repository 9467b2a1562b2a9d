// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_IMAGE_H_
#define SNAPREEL_CORE_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

struct PixelRect;

/// BGRA8 pixel buffer used for stills, backdrops and composited frames.
class Image {
 public:
  Image(int width, int height, int stride, SnapReelPixelFormat format,
        std::vector<uint8_t> data);
  ~Image() = default;

  // Non-copyable, movable.
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;
  Image(Image&&) = default;
  Image& operator=(Image&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }
  int stride() const { return stride_; }
  SnapReelPixelFormat format() const { return format_; }
  const uint8_t* data() const { return data_.data(); }
  size_t data_size() const { return data_.size(); }

  /// Create a zero-filled image (to be filled by caller).
  static std::unique_ptr<Image> Create(int width, int height,
                                       SnapReelPixelFormat format);

  /// Create an image from existing data (takes ownership via move).
  static std::unique_ptr<Image> CreateFromData(int width, int height,
                                               int stride,
                                               SnapReelPixelFormat format,
                                               std::vector<uint8_t> data);

  std::unique_ptr<Image> Clone() const;

  /// Copy out a sub-rectangle. The rect is clamped to the image bounds;
  /// returns nullptr if nothing remains after clamping.
  std::unique_ptr<Image> Crop(const PixelRect& rect) const;

  /// Get a mutable pointer to pixel data (for backends to fill).
  uint8_t* mutable_data() { return data_.data(); }

  /// Fill every pixel with the given BGRA value.
  void Fill(uint8_t b, uint8_t g, uint8_t r, uint8_t a);

 private:
  int width_;
  int height_;
  int stride_;
  SnapReelPixelFormat format_;
  std::vector<uint8_t> data_;
};

/// Nearest-neighbour scale of |src_rect| in |src| onto the whole of |dst|.
/// The source rect is clamped to |src|. Returns false if it is empty or the
/// formats differ.
bool BlitScaled(const Image& src, const PixelRect& src_rect, Image* dst);

/// Encode to PNG or JPEG and write to |path|. |quality| applies to JPEG only
/// (1..100, out-of-range values fall back to 90).
bool WriteImageFile(const Image& image, const std::string& path,
                    SnapReelImageFormat format, int quality);

/// Encode to PNG or JPEG in memory. Returns an empty vector on failure.
std::vector<uint8_t> EncodeImage(const Image& image,
                                 SnapReelImageFormat format, int quality);

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_IMAGE_H_
