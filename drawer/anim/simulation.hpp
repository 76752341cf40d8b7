#ifndef A26F984E_6CDF_4D92_AE08_144409E0BEF2
#define A26F984E_6CDF_4D92_AE08_144409E0BEF2

#include "curves.hpp"
#include <memory>

namespace drawer::anim {

struct Tolerance {
  float distance = 1e-3f;
  float time = 1e-3f;
  float velocity = 1e-3f;
};

// Position over time, time is in seconds since the start of the simulation
struct ISimulation {
  virtual ~ISimulation() = default;
  virtual float x(float time) const = 0;
  virtual float dx(float time) const = 0;
  virtual bool isDone(float time) const = 0;
};

// Moves from begin to end over a fixed duration following a curve
struct InterpolationSimulation final : public ISimulation {
  float begin;
  float end;
  float durationSeconds;
  CurvePtr curve;

  InterpolationSimulation(float begin, float end, float durationSeconds, CurvePtr curve);

  float x(float time) const override;
  float dx(float time) const override;
  bool isDone(float time) const override { return time > durationSeconds; }
};

struct SpringDescription {
  float mass = 1.0f;
  float stiffness = 500.0f;
  float damping = 44.72136f;

  // ratio 1 is critically damped, lower values oscillate
  static SpringDescription withDampingRatio(float mass, float stiffness, float ratio = 1.0f);
};

enum class SpringType { CriticallyDamped, UnderDamped, OverDamped };

// Damped harmonic oscillator settling on end
struct SpringSimulation final : public ISimulation {
  float end;
  Tolerance tolerance;

  SpringSimulation(const SpringDescription &spring, float start, float end, float velocity, Tolerance tolerance = {});

  float x(float time) const override { return end + offset(time); }
  float dx(float time) const override;
  bool isDone(float time) const override;

  SpringType getType() const { return type; }

private:
  SpringType type;
  float c1{};
  float c2{};
  float r1{};
  float r2{};
  float w{};

  float offset(float time) const;
};

} // namespace drawer::anim

#endif /* A26F984E_6CDF_4D92_AE08_144409E0BEF2 */
