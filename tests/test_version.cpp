// Copyright 2026 The snapreel Authors
// Tests for: snapreel_version_string, snapreel_version_major,
//            snapreel_version_minor, snapreel_version_patch

#include <cstring>
#include <string>

#include "gtest/gtest.h"
#include "snapreel/snapreel.h"

TEST(VersionTest, VersionStringIsNotNull) {
  const char* ver = snapreel_version_string();
  ASSERT_NE(ver, nullptr);
}

TEST(VersionTest, VersionStringMatchesMacro) {
  EXPECT_STREQ(snapreel_version_string(), SNAPREEL_VERSION_STRING);
}

TEST(VersionTest, VersionStringMatchesExpected) {
  EXPECT_STREQ(snapreel_version_string(), "1.0.0");
}

TEST(VersionTest, ComponentsMatchMacros) {
  EXPECT_EQ(snapreel_version_major(), SNAPREEL_VERSION_MAJOR);
  EXPECT_EQ(snapreel_version_minor(), SNAPREEL_VERSION_MINOR);
  EXPECT_EQ(snapreel_version_patch(), SNAPREEL_VERSION_PATCH);
}

TEST(VersionTest, StringIsDottedComponents) {
  std::string expected = std::to_string(snapreel_version_major()) + "." +
                         std::to_string(snapreel_version_minor()) + "." +
                         std::to_string(snapreel_version_patch());
  EXPECT_EQ(expected, snapreel_version_string());
}
