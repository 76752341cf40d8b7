#include "curves.hpp"
#include "../core/error_utils.hpp"
#include "../core/math.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace drawer::anim {

static constexpr float CubicErrorBound = 0.001f;

static float evaluateCubic(float p1, float p2, float m) {
  float u = 1.0f - m;
  return 3.0f * p1 * u * u * m + 3.0f * p2 * u * m * m + m * m * m;
}

Cubic::Cubic(float a, float b, float c, float d) : a(a), b(b), c(c), d(d) {
  // The bisection needs x(t) to be monotonic
  if (!(a >= 0.0f && a <= 1.0f && c >= 0.0f && c <= 1.0f))
    throw formatConfigurationError("Cubic x control points must be in [0,1], got {} and {}", a, c);
}

float Cubic::transform(float t) const {
  if (t <= 0.0f || t >= 1.0f)
    return clampUnit(t);

  // Bisect for the bezier parameter that lands on t along the x axis
  float start = 0.0f;
  float end = 1.0f;
  while (true) {
    float midpoint = (start + end) * 0.5f;
    float estimate = evaluateCubic(a, c, midpoint);
    if (std::abs(t - estimate) < CubicErrorBound)
      return evaluateCubic(b, d, midpoint);
    if (estimate < t)
      start = midpoint;
    else
      end = midpoint;
  }
}

std::string Cubic::getName() const { return fmt::format("cubic({}, {}, {}, {})", a, b, c, d); }

Interval::Interval(float begin, float end, CurvePtr curve) : begin(begin), end(end), curve(std::move(curve)) {
  if (!(begin >= 0.0f && begin <= 1.0f && end >= 0.0f && end <= 1.0f && end >= begin))
    throw formatConfigurationError("Invalid curve interval [{}, {}]", begin, end);
}

float Interval::transform(float t) const {
  if (t <= 0.0f || t >= 1.0f)
    return clampUnit(t);
  if (t <= begin)
    return 0.0f;
  if (t >= end)
    return 1.0f;
  float local = (t - begin) / (end - begin);
  return curve ? curve->transform(local) : local;
}

std::string Interval::getName() const {
  return fmt::format("interval({}, {}, {})", begin, end, curve ? curve->getName() : "linear");
}

Flipped::Flipped(CurvePtr curve) : curve(std::move(curve)) {
  if (!this->curve)
    throw ConfigurationError("Flipped curve requires an inner curve");
}

FunctionCurve::FunctionCurve(std::function<float(float)> fn, std::string name) : fn(std::move(fn)), name(std::move(name)) {
  if (!this->fn)
    throw ConfigurationError("Curve function is empty");
}

float FunctionCurve::transform(float t) const {
  if (t <= 0.0f || t >= 1.0f)
    return clampUnit(t);
  return fn(t);
}

namespace curves {
const CurvePtr linear = std::make_shared<Linear>();
const CurvePtr ease = std::make_shared<Cubic>(0.25f, 0.1f, 0.25f, 1.0f);
const CurvePtr easeIn = std::make_shared<Cubic>(0.42f, 0.0f, 1.0f, 1.0f);
const CurvePtr easeOut = std::make_shared<Cubic>(0.0f, 0.0f, 0.58f, 1.0f);
const CurvePtr easeInOut = std::make_shared<Cubic>(0.42f, 0.0f, 0.58f, 1.0f);
const CurvePtr fastOutSlowIn = std::make_shared<Cubic>(0.4f, 0.0f, 0.2f, 1.0f);
const CurvePtr decelerate = std::make_shared<FunctionCurve>(
    [](float t) {
      t = 1.0f - t;
      return 1.0f - t * t;
    },
    "decelerate");
} // namespace curves

} // namespace drawer::anim
