// Repository: stimkit
// Component: PlayerConfig
// Purpose: Tunables for the movie player, its stream reader and decoder.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_PLAYER_CONFIG_HPP_
#define STIMKIT_MOVIE_PLAYER_CONFIG_HPP_

#include <chrono>
#include <cstddef>

#include "stimkit/movie/IDecoderHandle.hpp"

namespace stimkit::movie {

struct PlayerConfig {
  // Frame hand-off depth between reader and player (minimum 1).
  std::size_t frame_queue_capacity = 1;

  // Reader poll cadence before the stream frame rate is known.
  std::chrono::microseconds warmup_poll_interval{1000};
  // Reader sleep while paused.
  std::chrono::microseconds paused_poll_interval{1000};
  // Player sleep between queue polls in a blocking GetMovieFrame().
  std::chrono::microseconds consumer_poll_interval{1000};

  // Upper bound on Start()'s first-frame warm-up pull.
  std::chrono::milliseconds warmup_timeout{10000};

  DecoderOptions decoder_options;
};

// Returns `base` with environment overrides applied:
//   STIMKIT_FRAME_QUEUE_DEPTH  frame_queue_capacity (>= 1)
//   STIMKIT_DECODE_THREADS     decoder_options.max_decode_threads (>= 0)
//   STIMKIT_WARMUP_TIMEOUT_MS  warmup_timeout (> 0)
// Unparseable or out-of-range values are ignored with a warning.
PlayerConfig ApplyEnvironmentOverrides(PlayerConfig base);

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_PLAYER_CONFIG_HPP_
