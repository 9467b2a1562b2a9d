// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_GEOMETRY_H_
#define SNAPREEL_CORE_GEOMETRY_H_

namespace snapreel {
namespace internal {

/// Selections smaller than this in either dimension count as "no selection".
constexpr int kMinSelectionSize = 5;

struct Point {
  int x = 0;
  int y = 0;
};

/// Rectangle in physical (device) pixels.
struct PixelRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;

  bool empty() const { return width <= 0 || height <= 0; }
};

/// Rectangle in logical screen pixels.
///
/// scale_factor is 0 until the rectangle is handed to the recorder, at which
/// point the display's logical-to-physical ratio is attached.
struct SelectionRect {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
  double scale_factor = 0.0;
};

bool operator==(const SelectionRect& a, const SelectionRect& b);
bool operator!=(const SelectionRect& a, const SelectionRect& b);
bool operator==(const PixelRect& a, const PixelRect& b);

/// Normalized rectangle spanned by a drag from |start| to |current|.
SelectionRect RectFromDrag(const Point& start, const Point& current);

/// Width and height are both at least kMinSelectionSize.
bool IsUsableSelection(const SelectionRect& rect);

bool Contains(const SelectionRect& rect, const Point& p);

/// Map a logical rect to physical pixels, rounding each component.
PixelRect ScaleToPhysical(const SelectionRect& rect, double scale_x,
                          double scale_y);

/// Same as above with the rect's own scale_factor (1.0 when unattached).
PixelRect ScaleToPhysical(const SelectionRect& rect);

/// Largest even value not above |v| (v >= 0).
inline int EvenFloor(int v) { return v & ~1; }

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_GEOMETRY_H_
