// Copyright 2026 The snapreel Authors
// Tests for: AppSettings persistence, IniSettingsStore

#include <fstream>
#include <string>

#include "core/app_settings.h"
#include "core/ini_settings.h"
#include "fakes.h"
#include "gtest/gtest.h"

using snapreel::fakes::FakeSettingsStore;
using snapreel::fakes::TempDir;
using namespace snapreel::internal;  // NOLINT

TEST(AppSettingsTest, Defaults) {
  AppSettings s = DefaultAppSettings();
  EXPECT_EQ(s.image_format, kSnapReelImagePng);
  EXPECT_EQ(s.video_format, kSnapReelVideoMp4);
  EXPECT_EQ(s.audio_source, kSnapReelAudioSystem);
  EXPECT_EQ(s.frame_rate, 30);
  EXPECT_EQ(s.shortcut_mode, kSnapReelShortcutStandard);
  EXPECT_TRUE(s.freeze_still);
  EXPECT_FALSE(s.save_path.empty());
}

TEST(AppSettingsTest, NullStoreGivesDefaults) {
  AppSettings s = LoadAppSettings(nullptr);
  EXPECT_EQ(s.frame_rate, 30);
  EXPECT_FALSE(SaveAppSettings(s, nullptr));
}

TEST(AppSettingsTest, ParseAcceptsAliases) {
  SnapReelImageFormat img = kSnapReelImagePng;
  EXPECT_TRUE(ParseImageFormat("jpg", &img));
  EXPECT_EQ(img, kSnapReelImageJpeg);
  EXPECT_FALSE(ParseImageFormat("gif", &img));
  EXPECT_EQ(img, kSnapReelImageJpeg);

  SnapReelAudioSource audio = kSnapReelAudioNone;
  EXPECT_TRUE(ParseAudioSource("mic", &audio));
  EXPECT_EQ(audio, kSnapReelAudioMicrophone);
  EXPECT_FALSE(ParseAudioSource("line-in", &audio));
}

TEST(AppSettingsTest, SaveThenLoad) {
  FakeSettingsStore store;
  AppSettings s = DefaultAppSettings();
  s.save_path = "/data/captures";
  s.image_format = kSnapReelImageJpeg;
  s.video_format = kSnapReelVideoWebm;
  s.audio_source = kSnapReelAudioMicrophone;
  s.frame_rate = 60;
  s.shortcut_mode = kSnapReelShortcutAlternative;
  s.freeze_still = false;
  ASSERT_TRUE(SaveAppSettings(s, &store));
  EXPECT_EQ(store.values[kKeyImageFormat], "jpeg");
  EXPECT_EQ(store.values[kKeyAudioSource], "mic");

  AppSettings loaded = LoadAppSettings(&store);
  EXPECT_EQ(loaded.save_path, "/data/captures");
  EXPECT_EQ(loaded.image_format, kSnapReelImageJpeg);
  EXPECT_EQ(loaded.video_format, kSnapReelVideoWebm);
  EXPECT_EQ(loaded.audio_source, kSnapReelAudioMicrophone);
  EXPECT_EQ(loaded.frame_rate, 60);
  EXPECT_EQ(loaded.shortcut_mode, kSnapReelShortcutAlternative);
  EXPECT_FALSE(loaded.freeze_still);
}

TEST(AppSettingsTest, InvalidValuesKeepDefaults) {
  FakeSettingsStore store;
  store.values[kKeyImageFormat] = "bmp";
  store.values[kKeyVideoFormat] = "avi";
  store.values[kKeyFrameRate] = "25";
  store.values[kKeyShortcutMode] = "emacs";
  AppSettings s = LoadAppSettings(&store);
  EXPECT_EQ(s.image_format, kSnapReelImagePng);
  EXPECT_EQ(s.video_format, kSnapReelVideoMp4);
  EXPECT_EQ(s.frame_rate, 30);
  EXPECT_EQ(s.shortcut_mode, kSnapReelShortcutStandard);
}

TEST(AppSettingsTest, SupportedFrameRates) {
  EXPECT_TRUE(IsSupportedFrameRate(30));
  EXPECT_TRUE(IsSupportedFrameRate(60));
  EXPECT_TRUE(IsSupportedFrameRate(90));
  EXPECT_FALSE(IsSupportedFrameRate(24));
  EXPECT_FALSE(IsSupportedFrameRate(0));
}

TEST(IniSettingsStoreTest, PersistsAcrossInstances) {
  TempDir dir;
  std::string path = dir.path() + "/cfg/snapreel.ini";
  {
    IniSettingsStore store(path);
    EXPECT_TRUE(store.SetString(kKeySavePath, "/x/y"));
    EXPECT_TRUE(store.SetInt(kKeyFrameRate, 90));
  }
  IniSettingsStore reopened(path);
  std::string str;
  int value = 0;
  ASSERT_TRUE(reopened.GetString(kKeySavePath, &str));
  EXPECT_EQ(str, "/x/y");
  ASSERT_TRUE(reopened.GetInt(kKeyFrameRate, &value));
  EXPECT_EQ(value, 90);
}

TEST(IniSettingsStoreTest, ParsesHandWrittenFile) {
  TempDir dir;
  std::string path = dir.path() + "/snapreel.ini";
  {
    std::ofstream f(path);
    f << "[Settings]\n"
      << "# comment\n"
      << "  ImageFormat = jpeg  \n"
      << "FrameRate=abc\n"
      << "garbage line\n";
  }
  IniSettingsStore store(path);
  std::string str;
  ASSERT_TRUE(store.GetString(kKeyImageFormat, &str));
  EXPECT_EQ(str, "jpeg");
  int value = 0;
  EXPECT_FALSE(store.GetInt(kKeyFrameRate, &value));
  EXPECT_FALSE(store.GetString("Missing", &str));
}

TEST(IniSettingsStoreTest, MissingFileIsEmpty) {
  TempDir dir;
  IniSettingsStore store(dir.path() + "/none.ini");
  std::string str;
  EXPECT_FALSE(store.GetString(kKeySavePath, &str));
}
