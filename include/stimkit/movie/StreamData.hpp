// Repository: stimkit
// Component: StreamData
// Purpose: Entry handed from the stream reader thread to the player:
//          metadata snapshot, decoded frame, and stream status.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_STREAM_DATA_HPP_
#define STIMKIT_MOVIE_STREAM_DATA_HPP_

#include <cstdint>

#include "stimkit/movie/MovieFrame.hpp"
#include "stimkit/movie/PlaybackStatus.hpp"
#include "stimkit/movie/StreamMetadata.hpp"

namespace stimkit::movie {

// StreamStatus is immutable once constructed.
// stream_time is the presentation time of the frame it accompanies and is
// monotonic while playing (only an explicit seek moves it backwards).
// recording_time / recording_bytes stay zero unless the stream is recorded.
class StreamStatus {
 public:
  StreamStatus() = default;
  StreamStatus(PlaybackStatus status, double stream_time,
               double recording_time = 0.0, uint64_t recording_bytes = 0)
      : status_(status),
        stream_time_(stream_time),
        recording_time_(recording_time),
        recording_bytes_(recording_bytes) {}

  PlaybackStatus status() const { return status_; }
  double stream_time() const { return stream_time_; }
  double recording_time() const { return recording_time_; }
  uint64_t recording_bytes() const { return recording_bytes_; }

 private:
  PlaybackStatus status_ = PlaybackStatus::kNotStarted;
  double stream_time_ = 0.0;
  double recording_time_ = 0.0;
  uint64_t recording_bytes_ = 0;
};

struct StreamData {
  StreamMetadata metadata;
  MovieFrame frame;
  StreamStatus status;
};

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_STREAM_DATA_HPP_
