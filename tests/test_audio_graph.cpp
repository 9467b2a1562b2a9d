// Copyright 2026 The snapreel Authors
// Tests for: AudioGraph mixing

#include <cstdint>
#include <vector>

#include "core/audio_graph.h"
#include "fakes.h"
#include "gtest/gtest.h"

using snapreel::fakes::FakeAudioTrack;
using snapreel::internal::AudioGraph;
using snapreel::internal::AudioSamples;

TEST(AudioGraphTest, EmptyGraphProducesSilence) {
  AudioGraph graph;
  AudioSamples s = graph.destination()->ReadSamples();
  EXPECT_TRUE(s.data.empty());
  EXPECT_TRUE(graph.destination()->IsLive());
}

TEST(AudioGraphTest, SingleSourcePassesThrough) {
  AudioGraph graph;
  FakeAudioTrack mic;
  ASSERT_TRUE(graph.Connect(&mic));
  mic.Push({1, 2, 3, 4});
  AudioSamples s = graph.destination()->ReadSamples();
  EXPECT_EQ(s.data, (std::vector<int16_t>{1, 2, 3, 4}));
  EXPECT_EQ(s.sample_rate, 44100);
  EXPECT_EQ(s.channels, 2);
}

TEST(AudioGraphTest, SourcesAreSummed) {
  AudioGraph graph;
  FakeAudioTrack a, b;
  ASSERT_TRUE(graph.Connect(&a));
  ASSERT_TRUE(graph.Connect(&b));
  EXPECT_EQ(graph.source_count(), 2u);
  a.Push({100, 200, 300, 400});
  b.Push({10, 20});
  AudioSamples s = graph.destination()->ReadSamples();
  EXPECT_EQ(s.data, (std::vector<int16_t>{110, 220, 300, 400}));
}

TEST(AudioGraphTest, MixSaturates) {
  AudioGraph graph;
  FakeAudioTrack a, b;
  ASSERT_TRUE(graph.Connect(&a));
  ASSERT_TRUE(graph.Connect(&b));
  a.Push({30000, -30000});
  b.Push({30000, -30000});
  AudioSamples s = graph.destination()->ReadSamples();
  ASSERT_EQ(s.data.size(), 2u);
  EXPECT_EQ(s.data[0], 32767);
  EXPECT_EQ(s.data[1], -32768);
}

TEST(AudioGraphTest, FormatMismatchRejected) {
  AudioGraph graph;
  FakeAudioTrack stereo(44100, 2);
  FakeAudioTrack mono(44100, 1);
  FakeAudioTrack hi_rate(48000, 2);
  ASSERT_TRUE(graph.Connect(&stereo));
  EXPECT_FALSE(graph.Connect(&mono));
  EXPECT_FALSE(graph.Connect(&hi_rate));
  EXPECT_FALSE(graph.Connect(nullptr));
  EXPECT_EQ(graph.source_count(), 1u);
}

TEST(AudioGraphTest, CloseEndsDestination) {
  AudioGraph graph;
  FakeAudioTrack a;
  ASSERT_TRUE(graph.Connect(&a));
  graph.Close();
  EXPECT_TRUE(graph.closed());
  EXPECT_FALSE(graph.destination()->IsLive());
  EXPECT_EQ(graph.source_count(), 0u);
  a.Push({1, 2});
  EXPECT_TRUE(graph.destination()->ReadSamples().data.empty());
  EXPECT_FALSE(graph.Connect(&a));
  // Closing does not stop the sources themselves.
  EXPECT_FALSE(a.stopped());
  graph.Close();
}

TEST(AudioGraphTest, StoppingDestinationClosesGraph) {
  AudioGraph graph;
  graph.destination()->Stop();
  EXPECT_TRUE(graph.closed());
}
