// Repository: ClipForge-render
// Component: Rational Frame Rate
// Purpose: Exact num/den frame-rate arithmetic for output frame counts and timestamps.
// Copyright (c) 2025 ClipForge

#ifndef CLIPFORGE_UTIL_RATIONAL_FPS_HPP_
#define CLIPFORGE_UTIL_RATIONAL_FPS_HPP_

#include <cmath>
#include <cstdint>

namespace clipforge::util {

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

  constexpr double ToDouble() const { return static_cast<double>(num) / static_cast<double>(den); }

  // Number of whole frames in |seconds| of output, rounded to nearest.
  int64_t FramesForDurationSec(double seconds) const {
    if (!IsValid() || seconds <= 0.0) return 0;
    return std::llround(seconds * static_cast<double>(num) / static_cast<double>(den));
  }

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const {
    return !(*this == other);
  }
};

}  // namespace clipforge::util

#endif  // CLIPFORGE_UTIL_RATIONAL_FPS_HPP_
