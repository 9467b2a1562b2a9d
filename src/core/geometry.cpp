// Copyright 2026 The snapreel Authors

#include "core/geometry.h"

#include <cmath>
#include <cstdlib>
#include <algorithm>

namespace snapreel {
namespace internal {

bool operator==(const SelectionRect& a, const SelectionRect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width &&
         a.height == b.height && a.scale_factor == b.scale_factor;
}

bool operator!=(const SelectionRect& a, const SelectionRect& b) {
  return !(a == b);
}

bool operator==(const PixelRect& a, const PixelRect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width &&
         a.height == b.height;
}

SelectionRect RectFromDrag(const Point& start, const Point& current) {
  SelectionRect r;
  r.x = std::min(start.x, current.x);
  r.y = std::min(start.y, current.y);
  r.width = std::abs(current.x - start.x);
  r.height = std::abs(current.y - start.y);
  return r;
}

bool IsUsableSelection(const SelectionRect& rect) {
  return rect.width >= kMinSelectionSize && rect.height >= kMinSelectionSize;
}

bool Contains(const SelectionRect& rect, const Point& p) {
  return p.x >= rect.x && p.x < rect.x + rect.width && p.y >= rect.y &&
         p.y < rect.y + rect.height;
}

PixelRect ScaleToPhysical(const SelectionRect& rect, double scale_x,
                          double scale_y) {
  PixelRect out;
  out.x = static_cast<int>(std::lround(rect.x * scale_x));
  out.y = static_cast<int>(std::lround(rect.y * scale_y));
  out.width = static_cast<int>(std::lround(rect.width * scale_x));
  out.height = static_cast<int>(std::lround(rect.height * scale_y));
  return out;
}

PixelRect ScaleToPhysical(const SelectionRect& rect) {
  double s = rect.scale_factor > 0.0 ? rect.scale_factor : 1.0;
  return ScaleToPhysical(rect, s, s);
}

}  // namespace internal
}  // namespace snapreel
