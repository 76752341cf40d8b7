#include "simulation.hpp"
#include "../core/error_utils.hpp"
#include "../core/math.hpp"
#include <cmath>

namespace drawer::anim {

InterpolationSimulation::InterpolationSimulation(float begin, float end, float durationSeconds, CurvePtr curve)
    : begin(begin), end(end), durationSeconds(durationSeconds), curve(std::move(curve)) {
  if (!(durationSeconds > 0.0f))
    throw formatConfigurationError("Interpolation duration must be positive, got {}s", durationSeconds);
  if (!this->curve)
    throw ConfigurationError("Interpolation requires a curve");
}

float InterpolationSimulation::x(float time) const {
  float t = clampUnit(time / durationSeconds);
  if (t == 0.0f)
    return begin;
  if (t == 1.0f)
    return end;
  return lerp(begin, end, curve->transform(t));
}

float InterpolationSimulation::dx(float time) const {
  // Central difference, the curve is opaque
  const float epsilon = 1e-3f;
  return (x(time + epsilon) - x(time - epsilon)) / (2.0f * epsilon);
}

SpringDescription SpringDescription::withDampingRatio(float mass, float stiffness, float ratio) {
  return SpringDescription{
      .mass = mass,
      .stiffness = stiffness,
      .damping = ratio * 2.0f * std::sqrt(mass * stiffness),
  };
}

SpringSimulation::SpringSimulation(const SpringDescription &spring, float start, float end, float velocity,
                                   Tolerance tolerance)
    : end(end), tolerance(tolerance) {
  if (!(spring.mass > 0.0f) || !(spring.stiffness > 0.0f) || !(spring.damping >= 0.0f))
    throw formatConfigurationError("Invalid spring (mass: {}, stiffness: {}, damping: {})", spring.mass, spring.stiffness,
                                   spring.damping);

  float distance = start - end;
  float mk4 = 4.0f * spring.mass * spring.stiffness;
  float cmk = spring.damping * spring.damping - mk4;

  // Relative tolerance, withDampingRatio(1) lands a few ulps off the exact critical damping
  if (std::abs(cmk) <= mk4 * 1e-4f) {
    type = SpringType::CriticallyDamped;
    r1 = -spring.damping / (2.0f * spring.mass);
    c1 = distance;
    c2 = velocity - r1 * distance;
  } else if (cmk > 0.0f) {
    type = SpringType::OverDamped;
    r1 = (-spring.damping - std::sqrt(cmk)) / (2.0f * spring.mass);
    r2 = (-spring.damping + std::sqrt(cmk)) / (2.0f * spring.mass);
    c2 = (velocity - r1 * distance) / (r2 - r1);
    c1 = distance - c2;
  } else {
    type = SpringType::UnderDamped;
    w = std::sqrt(-cmk) / (2.0f * spring.mass);
    r1 = -spring.damping / (2.0f * spring.mass);
    c1 = distance;
    c2 = (velocity - r1 * distance) / w;
  }
}

float SpringSimulation::offset(float time) const {
  switch (type) {
  case SpringType::CriticallyDamped:
    return (c1 + c2 * time) * std::exp(r1 * time);
  case SpringType::OverDamped:
    return c1 * std::exp(r1 * time) + c2 * std::exp(r2 * time);
  case SpringType::UnderDamped:
  default:
    return std::exp(r1 * time) * (c1 * std::cos(w * time) + c2 * std::sin(w * time));
  }
}

float SpringSimulation::dx(float time) const {
  switch (type) {
  case SpringType::CriticallyDamped: {
    float power = std::exp(r1 * time);
    return r1 * (c1 + c2 * time) * power + c2 * power;
  }
  case SpringType::OverDamped:
    return c1 * r1 * std::exp(r1 * time) + c2 * r2 * std::exp(r2 * time);
  case SpringType::UnderDamped:
  default: {
    float power = std::exp(r1 * time);
    float cosine = std::cos(w * time);
    float sine = std::sin(w * time);
    return power * (c2 * w * cosine - c1 * w * sine) + r1 * power * (c2 * sine + c1 * cosine);
  }
  }
}

bool SpringSimulation::isDone(float time) const {
  return std::abs(x(time) - end) < tolerance.distance && std::abs(dx(time)) < tolerance.velocity;
}

} // namespace drawer::anim
