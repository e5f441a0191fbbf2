// Repository: stimkit
// Component: MovieFrame
// Purpose: One decoded video frame as surfaced to the experiment thread.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_MOVIE_FRAME_HPP_
#define STIMKIT_MOVIE_MOVIE_FRAME_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "stimkit/movie/StreamMetadata.hpp"

namespace stimkit::movie {

// MovieFrame owns its pixel buffer. The player keeps exactly one live
// instance (the "last frame"); a dequeued frame is moved into that slot,
// replacing the previous one.
//
// frame_index == -1 marks the null sentinel (nothing decoded yet, or the
// cached frame was invalidated by a seek).
struct MovieFrame {
  int64_t frame_index = -1;
  double pts = 0.0;       // movie time, seconds
  double abs_time = 0.0;  // experiment time the frame was surfaced at
  FrameSize size;
  std::vector<uint8_t> color_data;  // raw decoded samples, decoder pixel format
  StreamMetadata metadata;
  std::string movie_lib;

  bool IsNull() const { return frame_index < 0 && color_data.empty(); }
};

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_MOVIE_FRAME_HPP_
