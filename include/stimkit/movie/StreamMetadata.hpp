// Repository: stimkit
// Component: StreamMetadata
// Purpose: Movie stream description reported by a decoder handle.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_STREAM_METADATA_HPP_
#define STIMKIT_MOVIE_STREAM_METADATA_HPP_

#include <string>

#include "stimkit/movie/RationalFps.hpp"

namespace stimkit::movie {

struct FrameSize {
  int width = 0;
  int height = 0;

  bool operator==(const FrameSize& other) const {
    return width == other.width && height == other.height;
  }
  bool operator!=(const FrameSize& other) const { return !(*this == other); }
};

// StreamMetadata is only accurate after the decoder has produced at least one
// frame; before that the frame rate may be the invalid 0/1.
struct StreamMetadata {
  std::string media_path;
  std::string title;
  double duration_sec = 0.0;
  RationalFps frame_rate;
  FrameSize frame_size;
  std::string pixel_format;
  std::string movie_lib;

  // Seconds each frame is presented; 0.0 while the frame rate is unknown.
  double FrameInterval() const { return frame_rate.FrameDurationSec(); }
};

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_STREAM_METADATA_HPP_
