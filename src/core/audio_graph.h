// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_AUDIO_GRAPH_H_
#define SNAPREEL_CORE_AUDIO_GRAPH_H_

#include <memory>
#include <mutex>
#include <vector>

#include "core/media_track.h"

namespace snapreel {
namespace internal {

/// Routes audio sources into a single destination node.
///
/// Connected sources are not attached anywhere else; the destination is the
/// only track handed to the encoder. The graph does not own its sources.
class AudioGraph {
 public:
  AudioGraph();
  ~AudioGraph();

  AudioGraph(const AudioGraph&) = delete;
  AudioGraph& operator=(const AudioGraph&) = delete;

  /// Connect a source. All sources must share rate and channel count.
  /// @return false if the graph is closed or the format does not match.
  bool Connect(AudioTrack* source);

  /// Destination node. Reading it mixes (sums with saturation) whatever each
  /// connected source produced since the last read. Valid until the graph is
  /// destroyed; ends when the graph is closed.
  AudioTrack* destination();

  /// Disconnect all sources and end the destination. Idempotent.
  void Close();

  bool closed() const;
  size_t source_count() const;

 private:
  class Destination;

  mutable std::mutex mutex_;
  std::vector<AudioTrack*> sources_;
  bool closed_ = false;
  std::unique_ptr<Destination> destination_;
};

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_AUDIO_GRAPH_H_
