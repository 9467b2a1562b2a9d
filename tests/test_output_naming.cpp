// Copyright 2026 The snapreel Authors
// Tests for: output file naming and path helpers

#include <sys/stat.h>

#include <chrono>
#include <cstdio>
#include <string>

#include "core/output_naming.h"
#include "fakes.h"
#include "gtest/gtest.h"

using snapreel::fakes::TempDir;
using snapreel::internal::DirName;
using snapreel::internal::EnsureDirectory;
using snapreel::internal::FileTimestamp;
using snapreel::internal::JoinPath;
using snapreel::internal::OutputFileName;
using snapreel::internal::ReplaceExtension;

namespace {

// 2024-03-05T07:08:09Z
std::chrono::system_clock::time_point FixedTime() {
  return std::chrono::system_clock::from_time_t(1709622489);
}

bool IsDirectory(const std::string& path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

}  // namespace

TEST(OutputNamingTest, TimestampIsFilesystemSafe) {
  std::string ts = FileTimestamp(FixedTime());
  EXPECT_EQ(ts, "2024-03-05T07-08-09");
  EXPECT_EQ(ts.find(':'), std::string::npos);
}

TEST(OutputNamingTest, FileNameCombinesParts) {
  EXPECT_EQ(OutputFileName("screenshot", FixedTime(), "png"),
            "screenshot-2024-03-05T07-08-09.png");
  EXPECT_EQ(OutputFileName("recording", FixedTime(), "webm"),
            "recording-2024-03-05T07-08-09.webm");
}

TEST(OutputNamingTest, JoinPath) {
  EXPECT_EQ(JoinPath("/home/u/Pictures", "a.png"), "/home/u/Pictures/a.png");
  EXPECT_EQ(JoinPath("/home/u/Pictures/", "a.png"), "/home/u/Pictures/a.png");
  EXPECT_EQ(JoinPath("", "a.png"), "a.png");
}

TEST(OutputNamingTest, ReplaceExtension) {
  EXPECT_EQ(ReplaceExtension("/tmp/rec.webm", "mp4"), "/tmp/rec.mp4");
  EXPECT_EQ(ReplaceExtension("/tmp/rec", "mp4"), "/tmp/rec.mp4");
  EXPECT_EQ(ReplaceExtension("/tmp/v1.2/rec", "mp4"), "/tmp/v1.2/rec.mp4");
}

TEST(OutputNamingTest, DirName) {
  EXPECT_EQ(DirName("/a/b/c.png"), "/a/b");
  EXPECT_EQ(DirName("/c.png"), "/");
  EXPECT_EQ(DirName("c.png"), "");
}

TEST(OutputNamingTest, EnsureDirectoryCreatesNested) {
  TempDir dir;
  std::string nested = dir.path() + "/one/two/three";
  ASSERT_TRUE(EnsureDirectory(nested));
  EXPECT_TRUE(IsDirectory(nested));
  // Existing directory is fine.
  EXPECT_TRUE(EnsureDirectory(nested));
  EXPECT_TRUE(EnsureDirectory(""));
}

TEST(OutputNamingTest, EnsureDirectoryFailsOverFile) {
  TempDir dir;
  std::string file = dir.path() + "/plain";
  FILE* f = std::fopen(file.c_str(), "w");
  ASSERT_NE(f, nullptr);
  std::fclose(f);
  EXPECT_FALSE(EnsureDirectory(file + "/sub"));
}
