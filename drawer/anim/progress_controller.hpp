#ifndef F703499C_E0D0_4B31_9F6E_1FEDC5F207BA
#define F703499C_E0D0_4B31_9F6E_1FEDC5F207BA

#include "curves.hpp"
#include "scheduler.hpp"
#include "simulation.hpp"
#include "../core/callback.hpp"
#include <chrono>
#include <memory>
#include <optional>

namespace drawer::anim {

enum class Phase {
  // Stopped at 0
  Dismissed,
  // Running towards 1, or resting mid-way after moving towards 1
  AnimatingForward,
  // Stopped at 1
  Completed,
  // Running towards 0, or resting mid-way after moving towards 0
  AnimatingReverse,
};

struct ProgressConfig {
  std::chrono::milliseconds forwardDuration{300};
  CurvePtr forwardCurve = curves::easeInOut;
  // Fall back to the forward duration and curve when not set
  std::optional<std::chrono::milliseconds> reverseDuration;
  CurvePtr reverseCurve;

  SpringDescription flingSpring = SpringDescription::withDampingRatio(1.0f, 500.0f, 1.0f);
  // How far past the bound the fling spring aims, also the distance at which it is considered settled
  float flingOvershoot = 0.01f;
  // Upper bound on the length of a fling, the value snaps to the bound after this
  std::chrono::milliseconds maxFlingDuration{1000};

  std::chrono::milliseconds getReverseDuration() const { return reverseDuration.value_or(forwardDuration); }
  const CurvePtr &getReverseCurve() const { return reverseCurve ? reverseCurve : forwardCurve; }

  // Throws ConfigurationError
  void validate() const;
};

// Owns a single progress value in [0,1] and animates it towards either bound
//  values and phases are reported to listeners synchronously
struct ProgressController {
  ProgressController(IFrameScheduler &scheduler, ProgressConfig config = ProgressConfig{});
  ProgressController(const ProgressController &) = delete;
  ProgressController &operator=(const ProgressController &) = delete;

  // Animate towards 1 using the forward duration and curve
  void open();
  // Animate towards 0 using the reverse duration and curve
  void close();
  // Closes when completed, otherwise opens
  void toggle();

  // Moves the value directly by delta (clamped), stops any running animation
  void addProgress(float delta);

  // Settles towards 1 for positive velocities and 0 for negative ones
  //  velocity is in units of progress per second
  void flingTo(float velocity);

  // Stops, returns to 0 and picks up configuration changes for the next run
  void reset();
  void reset(ProgressConfig newConfig);

  float value() const { return currentValue; }
  Phase phase() const { return currentPhase; }
  bool isDismissed() const { return currentPhase == Phase::Dismissed; }
  bool isCompleted() const { return currentPhase == Phase::Completed; }
  bool isAnimating() const { return ticker.isActive(); }

  const ProgressConfig &getConfig() const { return config; }

  CallbackHandle<float> addListener(std::function<void(float)> listener);
  CallbackHandle<Phase> addPhaseListener(std::function<void(Phase)> listener);

private:
  enum class Direction { Forward, Reverse };

  ProgressConfig config;
  Ticker ticker;

  std::unique_ptr<ISimulation> simulation;
  std::optional<float> maxRunSeconds;
  float runTarget{};

  float currentValue{};
  Phase currentPhase = Phase::Dismissed;
  Direction direction = Direction::Forward;

  std::shared_ptr<CallbackRegistry<float>> valueListeners;
  std::shared_ptr<CallbackRegistry<Phase>> phaseListeners;

  void animateTo(float target, Direction newDirection);
  void startRun(std::unique_ptr<ISimulation> &&newSimulation, float target, Direction newDirection,
                std::optional<float> maxSeconds);
  void stopRun();
  void settle(float target);
  void onTick(float elapsed);

  void setValue(float newValue);
  void updatePhase();
};

} // namespace drawer::anim

#endif /* F703499C_E0D0_4B31_9F6E_1FEDC5F207BA */
