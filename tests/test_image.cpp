// Copyright 2026 The snapreel Authors
// Tests for: Image, BlitScaled, EncodeImage, WriteImageFile

#include <sys/stat.h>

#include <cstring>
#include <string>

#include "core/geometry.h"
#include "core/image.h"
#include "fakes.h"
#include "gtest/gtest.h"

using snapreel::fakes::MakeGradient;
using snapreel::fakes::TempDir;
using snapreel::internal::BlitScaled;
using snapreel::internal::EncodeImage;
using snapreel::internal::Image;
using snapreel::internal::PixelRect;
using snapreel::internal::WriteImageFile;

namespace {

const uint8_t* PixelAt(const Image& img, int x, int y) {
  return img.data() + y * img.stride() + x * 4;
}

}  // namespace

TEST(ImageTest, CreateRejectsEmpty) {
  EXPECT_EQ(Image::Create(0, 10, kSnapReelFormatBgra8), nullptr);
  EXPECT_EQ(Image::Create(10, -1, kSnapReelFormatBgra8), nullptr);
}

TEST(ImageTest, CropCopiesPixels) {
  auto img = MakeGradient(64, 48);
  auto crop = img->Crop(PixelRect{10, 20, 8, 4});
  ASSERT_NE(crop, nullptr);
  EXPECT_EQ(crop->width(), 8);
  EXPECT_EQ(crop->height(), 4);
  EXPECT_EQ(PixelAt(*crop, 0, 0)[0], 10);  // B = x
  EXPECT_EQ(PixelAt(*crop, 0, 0)[1], 20);  // G = y
  EXPECT_EQ(PixelAt(*crop, 7, 3)[0], 17);
  EXPECT_EQ(PixelAt(*crop, 7, 3)[1], 23);
}

TEST(ImageTest, CropClampsToBounds) {
  auto img = MakeGradient(32, 32);
  auto crop = img->Crop(PixelRect{24, 24, 20, 20});
  ASSERT_NE(crop, nullptr);
  EXPECT_EQ(crop->width(), 8);
  EXPECT_EQ(crop->height(), 8);
}

TEST(ImageTest, CropOutsideReturnsNull) {
  auto img = MakeGradient(32, 32);
  EXPECT_EQ(img->Crop(PixelRect{40, 40, 10, 10}), nullptr);
}

TEST(ImageTest, BlitSameSizeIsExactCopy) {
  auto src = MakeGradient(40, 30);
  auto dst = Image::Create(10, 6, kSnapReelFormatBgra8);
  ASSERT_TRUE(BlitScaled(*src, PixelRect{5, 7, 10, 6}, dst.get()));
  EXPECT_EQ(PixelAt(*dst, 0, 0)[0], 5);
  EXPECT_EQ(PixelAt(*dst, 0, 0)[1], 7);
  EXPECT_EQ(PixelAt(*dst, 9, 5)[0], 14);
  EXPECT_EQ(PixelAt(*dst, 9, 5)[1], 12);
}

TEST(ImageTest, BlitDownscalesNearestNeighbour) {
  auto src = MakeGradient(40, 40);
  auto dst = Image::Create(10, 10, kSnapReelFormatBgra8);
  ASSERT_TRUE(BlitScaled(*src, PixelRect{0, 0, 20, 20}, dst.get()));
  // Every destination pixel samples a source pixel in the rect.
  EXPECT_EQ(PixelAt(*dst, 0, 0)[0], 0);
  EXPECT_LT(PixelAt(*dst, 9, 9)[0], 20);
  EXPECT_GE(PixelAt(*dst, 9, 9)[0], 18);
}

TEST(ImageTest, BlitRejectsEmptySource) {
  auto src = MakeGradient(16, 16);
  auto dst = Image::Create(4, 4, kSnapReelFormatBgra8);
  EXPECT_FALSE(BlitScaled(*src, PixelRect{20, 20, 4, 4}, dst.get()));
  EXPECT_FALSE(BlitScaled(*src, PixelRect{0, 0, 4, 4}, nullptr));
}

TEST(ImageTest, EncodePngHasSignature) {
  auto img = MakeGradient(16, 16);
  auto png = EncodeImage(*img, kSnapReelImagePng, 0);
  ASSERT_GT(png.size(), 8u);
  EXPECT_EQ(png[0], 0x89);
  EXPECT_EQ(png[1], 'P');
  EXPECT_EQ(png[2], 'N');
  EXPECT_EQ(png[3], 'G');
}

TEST(ImageTest, EncodeJpegHasSoiMarker) {
  auto img = MakeGradient(16, 16);
  auto jpg = EncodeImage(*img, kSnapReelImageJpeg, 90);
  ASSERT_GT(jpg.size(), 2u);
  EXPECT_EQ(jpg[0], 0xFF);
  EXPECT_EQ(jpg[1], 0xD8);
}

TEST(ImageTest, WriteImageFileCreatesFile) {
  TempDir dir;
  std::string path = dir.path() + "/out.png";
  auto img = MakeGradient(8, 8);
  ASSERT_TRUE(WriteImageFile(*img, path, kSnapReelImagePng, 0));
  struct stat st;
  ASSERT_EQ(stat(path.c_str(), &st), 0);
  EXPECT_GT(st.st_size, 0);
}

TEST(ImageTest, WriteImageFileBadPathFails) {
  auto img = MakeGradient(8, 8);
  EXPECT_FALSE(WriteImageFile(*img, "/nonexistent_dir_snapreel/x.png",
                              kSnapReelImagePng, 0));
}
