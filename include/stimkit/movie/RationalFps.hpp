// Repository: stimkit
// Component: RationalFps
// Purpose: Exact frame-rate representation. Frame interval and reader poll
//          cadence are derived as den/num, never from a rounded float rate.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_RATIONAL_FPS_HPP_
#define STIMKIT_MOVIE_RATIONAL_FPS_HPP_

#include <cstdint>

namespace stimkit::movie {

constexpr int64_t FpsAbs64(int64_t v) { return v < 0 ? -v : v; }

constexpr int64_t FpsGcd64(int64_t a, int64_t b) {
  a = FpsAbs64(a);
  b = FpsAbs64(b);
  while (b != 0) {
    const int64_t t = a % b;
    a = b;
    b = t;
  }
  return a == 0 ? 1 : a;
}

// Decoders may report 0/0 or n/0 until the first frame has been decoded.
// Any such rate normalizes to the invalid 0/1.
struct RationalFps {
  int64_t num;
  int64_t den;

  constexpr RationalFps(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    NormalizeInPlace();
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  constexpr void NormalizeInPlace() {
    if (den == 0) {
      num = 0;
      den = 1;
      return;
    }
    if (den < 0) {
      den = -den;
      num = -num;
    }
    if (num <= 0 || den <= 0) {
      num = 0;
      den = 1;
      return;
    }
    const int64_t g = FpsGcd64(num, den);
    num /= g;
    den /= g;
  }

  // Frame interval in seconds; 0.0 when the rate is unknown.
  constexpr double FrameDurationSec() const {
    return IsValid() ? (static_cast<double>(den) / static_cast<double>(num)) : 0.0;
  }

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const {
    return !(*this == other);
  }
};

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_RATIONAL_FPS_HPP_
