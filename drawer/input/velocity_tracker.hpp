#ifndef D1CAF394_6DD0_45CC_979F_9A6366F6AFB5
#define D1CAF394_6DD0_45CC_979F_9A6366F6AFB5

#include "../core/linalg.hpp"
#include <array>
#include <cstddef>

namespace drawer::input {
using namespace linalg::aliases;

// Estimates pointer velocity from recent position samples
//  using a least squares line fit per axis
struct VelocityTracker {
  static constexpr size_t HistorySize = 20;

  // Samples older than this (relative to the newest one) are ignored
  double horizon = 0.1;
  // A pause longer than this between samples means the pointer stopped
  double stopGap = 0.04;
  float maxVelocity = 8000.0f;

  void addPosition(double time, float2 position);
  void reset();

  // Units per second, zero when there is not enough data
  float2 getVelocity() const;

  size_t size() const { return count; }

private:
  struct Sample {
    double time;
    float2 position;
  };
  std::array<Sample, HistorySize> samples{};
  size_t head{};
  size_t count{};
};

} // namespace drawer::input

#endif /* D1CAF394_6DD0_45CC_979F_9A6366F6AFB5 */
