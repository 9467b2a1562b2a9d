// Copyright 2026 The snapreel Authors
// Tests for: RectFromDrag, IsUsableSelection, ScaleToPhysical, EvenFloor

#include "core/geometry.h"
#include "gtest/gtest.h"

using snapreel::internal::EvenFloor;
using snapreel::internal::IsUsableSelection;
using snapreel::internal::PixelRect;
using snapreel::internal::Point;
using snapreel::internal::RectFromDrag;
using snapreel::internal::ScaleToPhysical;
using snapreel::internal::SelectionRect;

TEST(GeometryTest, DragNormalizesDirection) {
  SelectionRect r = RectFromDrag(Point{300, 250}, Point{100, 100});
  EXPECT_EQ(r.x, 100);
  EXPECT_EQ(r.y, 100);
  EXPECT_EQ(r.width, 200);
  EXPECT_EQ(r.height, 150);
  EXPECT_EQ(r.scale_factor, 0.0);
}

TEST(GeometryTest, UsableSelectionThreshold) {
  EXPECT_TRUE(IsUsableSelection(SelectionRect{0, 0, 5, 5}));
  EXPECT_FALSE(IsUsableSelection(SelectionRect{0, 0, 4, 100}));
  EXPECT_FALSE(IsUsableSelection(SelectionRect{0, 0, 100, 4}));
  EXPECT_FALSE(IsUsableSelection(SelectionRect()));
}

TEST(GeometryTest, ScaleToPhysicalUsesAttachedFactor) {
  SelectionRect r{100, 100, 200, 150, 2.0};
  PixelRect p = ScaleToPhysical(r);
  EXPECT_EQ(p, (PixelRect{200, 200, 400, 300}));
}

TEST(GeometryTest, UnattachedScaleIsIdentity) {
  SelectionRect r{10, 20, 30, 40};
  EXPECT_EQ(ScaleToPhysical(r), (PixelRect{10, 20, 30, 40}));
}

TEST(GeometryTest, FractionalScaleRounds) {
  SelectionRect r{3, 3, 7, 7, 1.5};
  // 4.5 -> 5, 10.5 -> 11
  EXPECT_EQ(ScaleToPhysical(r), (PixelRect{5, 5, 11, 11}));
}

TEST(GeometryTest, IndependentAxisScale) {
  SelectionRect r{10, 10, 100, 100};
  EXPECT_EQ(ScaleToPhysical(r, 2.0, 1.0), (PixelRect{20, 10, 200, 100}));
}

TEST(GeometryTest, EvenFloor) {
  EXPECT_EQ(EvenFloor(101), 100);
  EXPECT_EQ(EvenFloor(51), 50);
  EXPECT_EQ(EvenFloor(64), 64);
  EXPECT_EQ(EvenFloor(1), 0);
}
