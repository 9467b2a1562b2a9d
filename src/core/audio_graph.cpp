// Copyright 2026 The snapreel Authors

#include "core/audio_graph.h"

#include <algorithm>
#include <cstdint>
#include <limits>

#include "core/logger.h"

namespace snapreel {
namespace internal {

// ---------------------------------------------------------------------------
// Destination node
// ---------------------------------------------------------------------------

class AudioGraph::Destination : public AudioTrack {
 public:
  explicit Destination(AudioGraph* graph) : graph_(graph) {}

  bool IsLive() const override { return !graph_->closed(); }

  AudioSamples ReadSamples() override {
    AudioSamples mixed;
    std::lock_guard<std::mutex> lock(graph_->mutex_);
    if (graph_->closed_ || graph_->sources_.empty()) return mixed;
    mixed.sample_rate = graph_->sources_.front()->GetSampleRate();
    mixed.channels = graph_->sources_.front()->GetChannels();

    std::vector<int32_t> acc;
    bool first = true;
    for (AudioTrack* source : graph_->sources_) {
      AudioSamples s = source->ReadSamples();
      if (s.data.empty()) continue;
      if (first) {
        mixed.timestamp_ns = s.timestamp_ns;
        first = false;
      }
      if (acc.size() < s.data.size()) acc.resize(s.data.size(), 0);
      for (size_t i = 0; i < s.data.size(); ++i) acc[i] += s.data[i];
    }

    mixed.data.resize(acc.size());
    for (size_t i = 0; i < acc.size(); ++i) {
      int32_t v = std::min<int32_t>(
          std::max<int32_t>(acc[i], std::numeric_limits<int16_t>::min()),
          std::numeric_limits<int16_t>::max());
      mixed.data[i] = static_cast<int16_t>(v);
    }
    return mixed;
  }

  int GetSampleRate() const override {
    std::lock_guard<std::mutex> lock(graph_->mutex_);
    return graph_->sources_.empty() ? 44100
                                    : graph_->sources_.front()->GetSampleRate();
  }

  int GetChannels() const override {
    std::lock_guard<std::mutex> lock(graph_->mutex_);
    return graph_->sources_.empty() ? 2
                                    : graph_->sources_.front()->GetChannels();
  }

  // The destination ends with its graph.
  void Stop() override { graph_->Close(); }

 private:
  AudioGraph* graph_;
};

// ---------------------------------------------------------------------------
// AudioGraph
// ---------------------------------------------------------------------------

AudioGraph::AudioGraph() : destination_(std::make_unique<Destination>(this)) {}

AudioGraph::~AudioGraph() { Close(); }

bool AudioGraph::Connect(AudioTrack* source) {
  if (!source) return false;
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    SNAPREEL_LOG_WARN("AudioGraph: connect after close ignored");
    return false;
  }
  if (!sources_.empty()) {
    AudioTrack* ref = sources_.front();
    if (ref->GetSampleRate() != source->GetSampleRate() ||
        ref->GetChannels() != source->GetChannels()) {
      SNAPREEL_LOG_WARN("AudioGraph: format mismatch ({}Hz/{}ch vs {}Hz/{}ch)",
                        source->GetSampleRate(), source->GetChannels(),
                        ref->GetSampleRate(), ref->GetChannels());
      return false;
    }
  }
  sources_.push_back(source);
  return true;
}

AudioTrack* AudioGraph::destination() { return destination_.get(); }

void AudioGraph::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) return;
  closed_ = true;
  sources_.clear();
  SNAPREEL_LOG_DEBUG("AudioGraph closed");
}

bool AudioGraph::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t AudioGraph::source_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sources_.size();
}

}  // namespace internal
}  // namespace snapreel
