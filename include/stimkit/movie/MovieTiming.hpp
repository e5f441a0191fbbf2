// Repository: stimkit
// Component: MovieTiming
// Purpose: Frame index <-> movie time arithmetic shared by the stream reader
//          (frame stamping) and the player (timing conversions).
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_MOVIE_TIMING_HPP_
#define STIMKIT_MOVIE_MOVIE_TIMING_HPP_

#include <cmath>
#include <cstdint>
#include <limits>

namespace stimkit::movie {

// i * interval / interval can land one ulp below i; the nudge keeps
// FrameIndexFromMovieTime(MovieTimeFromFrameIndex(i)) == i for |i| up to
// kMaxExactFrameIndex without moving any genuine frame boundary.
inline constexpr double kFrameIndexEpsilon = 1e-7;
inline constexpr int64_t kMaxExactFrameIndex = 100000000;

// Movie time at which frame `frame_index` is scheduled. Negative indexes give
// negative times. Returns 0.0 when the interval is unknown.
inline double MovieTimeFromFrameIndex(int64_t frame_index, double frame_interval) {
  if (!(frame_interval > 0.0)) return 0.0;
  return static_cast<double>(frame_index) * frame_interval;
}

// Index of the frame presented at `movie_time`: floor(movie_time / interval),
// saturated to the int64_t range. Returns -1 when the interval is unknown or
// movie_time is NaN.
inline int64_t FrameIndexFromMovieTime(double movie_time, double frame_interval) {
  if (!(frame_interval > 0.0)) return -1;
  const double index = std::floor(movie_time / frame_interval + kFrameIndexEpsilon);
  if (std::isnan(index)) return -1;
  // 2^63 is exactly representable; every double below it fits in int64_t.
  constexpr double kLimit = 9223372036854775808.0;
  if (index >= kLimit) return std::numeric_limits<int64_t>::max();
  if (index < -kLimit) return std::numeric_limits<int64_t>::min();
  return static_cast<int64_t>(index);
}

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_MOVIE_TIMING_HPP_
