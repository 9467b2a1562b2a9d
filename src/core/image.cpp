// Copyright 2026 The snapreel Authors

#include "core/image.h"

#include <algorithm>
#include <cstring>
#include <utility>

#include "core/geometry.h"

namespace snapreel {
namespace internal {

namespace {

constexpr int kBytesPerPixel = 4;

// Intersect |rect| with [0, width) x [0, height).
PixelRect ClampToBounds(const PixelRect& rect, int width, int height) {
  int x0 = std::max(rect.x, 0);
  int y0 = std::max(rect.y, 0);
  int x1 = std::min(rect.x + rect.width, width);
  int y1 = std::min(rect.y + rect.height, height);
  PixelRect out;
  out.x = x0;
  out.y = y0;
  out.width = std::max(x1 - x0, 0);
  out.height = std::max(y1 - y0, 0);
  return out;
}

}  // namespace

Image::Image(int width, int height, int stride, SnapReelPixelFormat format,
             std::vector<uint8_t> data)
    : width_(width),
      height_(height),
      stride_(stride),
      format_(format),
      data_(std::move(data)) {}

static constexpr size_t kMaxImageBytes = 256ULL * 1024 * 1024;  // 256 MB

// static
std::unique_ptr<Image> Image::Create(int width, int height,
                                     SnapReelPixelFormat format) {
  if (width <= 0 || height <= 0) return nullptr;
  int stride = width * kBytesPerPixel;
  size_t total = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (total > kMaxImageBytes) return nullptr;
  std::vector<uint8_t> data(total, 0);
  return std::make_unique<Image>(width, height, stride, format,
                                 std::move(data));
}

// static
std::unique_ptr<Image> Image::CreateFromData(int width, int height, int stride,
                                             SnapReelPixelFormat format,
                                             std::vector<uint8_t> data) {
  if (width <= 0 || height <= 0 || stride < width * kBytesPerPixel) {
    return nullptr;
  }
  size_t required = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (data.size() < required) return nullptr;
  return std::make_unique<Image>(width, height, stride, format,
                                 std::move(data));
}

std::unique_ptr<Image> Image::Clone() const {
  std::vector<uint8_t> data_copy(data_);
  return std::make_unique<Image>(width_, height_, stride_, format_,
                                 std::move(data_copy));
}

std::unique_ptr<Image> Image::Crop(const PixelRect& rect) const {
  PixelRect r = ClampToBounds(rect, width_, height_);
  if (r.width <= 0 || r.height <= 0) return nullptr;

  auto out = Create(r.width, r.height, format_);
  if (!out) return nullptr;
  size_t row_bytes = static_cast<size_t>(r.width) * kBytesPerPixel;
  for (int y = 0; y < r.height; ++y) {
    const uint8_t* src = data_.data() +
                         static_cast<size_t>(r.y + y) * stride_ +
                         static_cast<size_t>(r.x) * kBytesPerPixel;
    std::memcpy(out->mutable_data() + static_cast<size_t>(y) * out->stride(),
                src, row_bytes);
  }
  return out;
}

void Image::Fill(uint8_t b, uint8_t g, uint8_t r, uint8_t a) {
  for (int y = 0; y < height_; ++y) {
    uint8_t* row = data_.data() + static_cast<size_t>(y) * stride_;
    for (int x = 0; x < width_; ++x) {
      row[x * 4 + 0] = b;
      row[x * 4 + 1] = g;
      row[x * 4 + 2] = r;
      row[x * 4 + 3] = a;
    }
  }
}

bool BlitScaled(const Image& src, const PixelRect& src_rect, Image* dst) {
  if (!dst || src.format() != dst->format()) return false;
  PixelRect r = ClampToBounds(src_rect, src.width(), src.height());
  if (r.width <= 0 || r.height <= 0) return false;

  const int dw = dst->width();
  const int dh = dst->height();

  // Same size: straight row copies.
  if (r.width == dw && r.height == dh) {
    size_t row_bytes = static_cast<size_t>(dw) * kBytesPerPixel;
    for (int y = 0; y < dh; ++y) {
      std::memcpy(dst->mutable_data() + static_cast<size_t>(y) * dst->stride(),
                  src.data() + static_cast<size_t>(r.y + y) * src.stride() +
                      static_cast<size_t>(r.x) * kBytesPerPixel,
                  row_bytes);
    }
    return true;
  }

  std::vector<int> x_map(dw);
  for (int x = 0; x < dw; ++x) {
    int sx = static_cast<int>((static_cast<int64_t>(x) * r.width) / dw);
    x_map[x] = (r.x + sx) * kBytesPerPixel;
  }
  for (int y = 0; y < dh; ++y) {
    int sy = r.y + static_cast<int>((static_cast<int64_t>(y) * r.height) / dh);
    const uint8_t* src_row = src.data() + static_cast<size_t>(sy) * src.stride();
    uint8_t* dst_row = dst->mutable_data() + static_cast<size_t>(y) * dst->stride();
    for (int x = 0; x < dw; ++x) {
      std::memcpy(dst_row + x * kBytesPerPixel, src_row + x_map[x],
                  kBytesPerPixel);
    }
  }
  return true;
}

}  // namespace internal
}  // namespace snapreel
