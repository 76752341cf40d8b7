#ifndef CD998BAC_3E64_4201_8656_364F7A20A8C6
#define CD998BAC_3E64_4201_8656_364F7A20A8C6

#include <functional>
#include <memory>
#include <string>

namespace drawer::anim {

// Maps normalized time [0,1] to normalized progress
//  transform(0) must be 0 and transform(1) must be 1
struct ICurve {
  virtual ~ICurve() = default;
  virtual float transform(float t) const = 0;
  virtual std::string getName() const = 0;
};

typedef std::shared_ptr<const ICurve> CurvePtr;

struct Linear final : public ICurve {
  float transform(float t) const override { return t; }
  std::string getName() const override { return "linear"; }
};

// CSS style cubic bezier with fixed end points (0,0) and (1,1)
struct Cubic final : public ICurve {
  float a, b, c, d;

  // Throws ConfigurationError when a or c is outside of [0,1]
  Cubic(float a, float b, float c, float d);
  float transform(float t) const override;
  std::string getName() const override;
};

// Runs the inner curve between begin and end, clamped outside of it
struct Interval final : public ICurve {
  float begin;
  float end;
  CurvePtr curve;

  Interval(float begin, float end, CurvePtr curve = nullptr);
  float transform(float t) const override;
  std::string getName() const override;
};

// Inverse of the inner curve, used to play a curve backwards
struct Flipped final : public ICurve {
  CurvePtr curve;

  Flipped(CurvePtr curve);
  float transform(float t) const override { return 1.0f - curve->transform(1.0f - t); }
  std::string getName() const override { return "flipped(" + curve->getName() + ")"; }
};

// Host provided curve function
struct FunctionCurve final : public ICurve {
  std::function<float(float)> fn;
  std::string name;

  FunctionCurve(std::function<float(float)> fn, std::string name = "function");
  float transform(float t) const override;
  std::string getName() const override { return name; }
};

namespace curves {
extern const CurvePtr linear;
extern const CurvePtr ease;
extern const CurvePtr easeIn;
extern const CurvePtr easeOut;
extern const CurvePtr easeInOut;
extern const CurvePtr fastOutSlowIn;
extern const CurvePtr decelerate;
} // namespace curves

} // namespace drawer::anim

#endif /* CD998BAC_3E64_4201_8656_364F7A20A8C6 */
