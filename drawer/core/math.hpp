#ifndef DRAWER_MATH
#define DRAWER_MATH

#include <algorithm>

namespace drawer {
constexpr float pi = 3.14159265359f;
constexpr float halfPi = pi / 2.0f;

// Clamps progress to [0,1], NaN maps to 0
inline float clampUnit(float v) {
  if (!(v > 0.0f))
    return 0.0f;
  return std::min(v, 1.0f);
}

template <typename T> inline constexpr T lerp(T a, T b, float t) { return a + (b - a) * t; }
} // namespace drawer

#endif // DRAWER_MATH
