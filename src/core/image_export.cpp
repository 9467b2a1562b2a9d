// Copyright 2026 The snapreel Authors
//
// Still image encoding using stb_image_write (PNG, JPEG).

#include "core/image.h"

#include <vector>

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#endif

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include "core/logger.h"

namespace snapreel {
namespace internal {

namespace {

constexpr int kDefaultJpegQuality = 90;

// stb_image_write expects tightly packed RGBA.
std::vector<uint8_t> ToPackedRgba(const Image& img) {
  const int w = img.width();
  const int h = img.height();
  const bool swap = img.format() == kSnapReelFormatBgra8;
  std::vector<uint8_t> rgba(static_cast<size_t>(w) * h * 4);
  for (int y = 0; y < h; ++y) {
    const uint8_t* row = img.data() + static_cast<size_t>(y) * img.stride();
    uint8_t* dst = rgba.data() + static_cast<size_t>(y) * w * 4;
    for (int x = 0; x < w; ++x) {
      dst[x * 4 + 0] = row[x * 4 + (swap ? 2 : 0)];
      dst[x * 4 + 1] = row[x * 4 + 1];
      dst[x * 4 + 2] = row[x * 4 + (swap ? 0 : 2)];
      dst[x * 4 + 3] = row[x * 4 + 3];
    }
  }
  return rgba;
}

void AppendToVector(void* context, void* data, int size) {
  auto* out = static_cast<std::vector<uint8_t>*>(context);
  const auto* bytes = static_cast<const uint8_t*>(data);
  out->insert(out->end(), bytes, bytes + size);
}

int NormalizeQuality(int quality) {
  return (quality <= 0 || quality > 100) ? kDefaultJpegQuality : quality;
}

}  // namespace

bool WriteImageFile(const Image& image, const std::string& path,
                    SnapReelImageFormat format, int quality) {
  if (path.empty()) return false;
  std::vector<uint8_t> rgba = ToPackedRgba(image);
  const int w = image.width();
  const int h = image.height();

  int result = 0;
  switch (format) {
    case kSnapReelImagePng:
      result = stbi_write_png(path.c_str(), w, h, 4, rgba.data(), w * 4);
      break;
    case kSnapReelImageJpeg:
      result = stbi_write_jpg(path.c_str(), w, h, 4, rgba.data(),
                              NormalizeQuality(quality));
      break;
    default:
      return false;
  }
  if (!result) {
    SNAPREEL_LOG_ERROR("Failed to write image file: {}", path);
    return false;
  }
  return true;
}

std::vector<uint8_t> EncodeImage(const Image& image,
                                 SnapReelImageFormat format, int quality) {
  std::vector<uint8_t> rgba = ToPackedRgba(image);
  const int w = image.width();
  const int h = image.height();

  std::vector<uint8_t> out;
  int result = 0;
  switch (format) {
    case kSnapReelImagePng:
      result = stbi_write_png_to_func(AppendToVector, &out, w, h, 4,
                                      rgba.data(), w * 4);
      break;
    case kSnapReelImageJpeg:
      result = stbi_write_jpg_to_func(AppendToVector, &out, w, h, 4,
                                      rgba.data(), NormalizeQuality(quality));
      break;
    default:
      break;
  }
  if (!result) out.clear();
  return out;
}

}  // namespace internal
}  // namespace snapreel
