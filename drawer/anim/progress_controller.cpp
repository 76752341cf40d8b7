#include "progress_controller.hpp"
#include "log.hpp"
#include "../core/error_utils.hpp"
#include "../core/math.hpp"
#include <magic_enum.hpp>
#include <cmath>
#include <limits>

namespace drawer::anim {

static auto logger = getLogger();

static float toSeconds(std::chrono::milliseconds duration) { return std::chrono::duration<float>(duration).count(); }

void ProgressConfig::validate() const {
  if (forwardDuration.count() <= 0)
    throw formatConfigurationError("Duration must be positive, got {}ms", forwardDuration.count());
  if (reverseDuration && reverseDuration->count() <= 0)
    throw formatConfigurationError("Reverse duration must be positive, got {}ms", reverseDuration->count());
  if (!forwardCurve)
    throw ConfigurationError("Curve is required");
  if (maxFlingDuration.count() <= 0)
    throw formatConfigurationError("Max fling duration must be positive, got {}ms", maxFlingDuration.count());
  if (!(flingOvershoot > 0.0f))
    throw formatConfigurationError("Fling overshoot must be positive, got {}", flingOvershoot);
  if (!(flingSpring.mass > 0.0f) || !(flingSpring.stiffness > 0.0f) || !(flingSpring.damping >= 0.0f))
    throw formatConfigurationError("Invalid fling spring (mass: {}, stiffness: {}, damping: {})", flingSpring.mass,
                                   flingSpring.stiffness, flingSpring.damping);
}

ProgressController::ProgressController(IFrameScheduler &scheduler, ProgressConfig config_)
    : config(std::move(config_)), ticker(scheduler, [this](float elapsed) { onTick(elapsed); }),
      valueListeners(std::make_shared<CallbackRegistry<float>>()),
      phaseListeners(std::make_shared<CallbackRegistry<Phase>>()) {
  config.validate();
}

void ProgressController::open() { animateTo(1.0f, Direction::Forward); }

void ProgressController::close() { animateTo(0.0f, Direction::Reverse); }

void ProgressController::toggle() {
  if (isCompleted())
    close();
  else
    open();
}

void ProgressController::addProgress(float delta) {
  stopRun();

  float previous = currentValue;
  setValue(currentValue + delta);
  if (currentValue > previous)
    direction = Direction::Forward;
  else if (currentValue < previous)
    direction = Direction::Reverse;

  valueListeners->call(currentValue);
  updatePhase();
}

void ProgressController::flingTo(float velocity) {
  Direction newDirection = velocity < 0.0f ? Direction::Reverse : Direction::Forward;
  float target = newDirection == Direction::Reverse ? 0.0f : 1.0f;
  float springTarget = newDirection == Direction::Reverse ? -config.flingOvershoot : 1.0f + config.flingOvershoot;

  // Only distance matters for settling, the value is clamped at the bound anyway
  Tolerance tolerance{
      .distance = config.flingOvershoot,
      .velocity = std::numeric_limits<float>::infinity(),
  };

  SPDLOG_LOGGER_DEBUG(logger, "Fling from {} with velocity {}", currentValue, velocity);
  startRun(std::make_unique<SpringSimulation>(config.flingSpring, currentValue, springTarget, velocity, tolerance), target,
           newDirection, toSeconds(config.maxFlingDuration));
}

void ProgressController::reset() {
  stopRun();
  direction = Direction::Forward;

  bool changed = currentValue != 0.0f;
  currentValue = 0.0f;
  if (changed)
    valueListeners->call(currentValue);
  updatePhase();
}

void ProgressController::reset(ProgressConfig newConfig) {
  newConfig.validate();
  config = std::move(newConfig);
  reset();
}

CallbackHandle<float> ProgressController::addListener(std::function<void(float)> listener) {
  return valueListeners->add(std::move(listener));
}

CallbackHandle<Phase> ProgressController::addPhaseListener(std::function<void(Phase)> listener) {
  return phaseListeners->add(std::move(listener));
}

void ProgressController::animateTo(float target, Direction newDirection) {
  bool forward = newDirection == Direction::Forward;
  float duration = toSeconds(forward ? config.forwardDuration : config.getReverseDuration());
  const CurvePtr &curve = forward ? config.forwardCurve : config.getReverseCurve();

  // Scale by the remaining distance so partially open states don't take the full duration
  float remaining = std::abs(target - currentValue);
  float scaledDuration = duration * remaining;
  if (!(scaledDuration > 0.0f)) {
    direction = newDirection;
    settle(target);
    return;
  }

  SPDLOG_LOGGER_DEBUG(logger, "Animate {} -> {} over {}s ({})", currentValue, target, scaledDuration, curve->getName());
  startRun(std::make_unique<InterpolationSimulation>(currentValue, target, scaledDuration, curve), target, newDirection,
           std::nullopt);
}

void ProgressController::startRun(std::unique_ptr<ISimulation> &&newSimulation, float target, Direction newDirection,
                                  std::optional<float> maxSeconds) {
  // Latest request wins, the previous run never ticks again
  stopRun();

  simulation = std::move(newSimulation);
  runTarget = target;
  maxRunSeconds = maxSeconds;
  direction = newDirection;
  ticker.start();
  updatePhase();
}

void ProgressController::stopRun() {
  ticker.stop();
  simulation.reset();
  maxRunSeconds.reset();
}

void ProgressController::settle(float target) {
  stopRun();
  if (currentValue != target) {
    currentValue = target;
    valueListeners->call(currentValue);
  }
  updatePhase();
}

void ProgressController::onTick(float elapsed) {
  if (!simulation)
    return;

  bool done = simulation->isDone(elapsed) || (maxRunSeconds && elapsed >= *maxRunSeconds);
  if (done) {
    SPDLOG_LOGGER_DEBUG(logger, "Run settled at {} after {}s", runTarget, elapsed);
    stopRun();
    currentValue = runTarget;
  } else {
    setValue(simulation->x(elapsed));
  }

  SPDLOG_LOGGER_TRACE(logger, "Tick {}s value: {}", elapsed, currentValue);
  valueListeners->call(currentValue);
  updatePhase();
}

void ProgressController::setValue(float newValue) { currentValue = clampUnit(newValue); }

void ProgressController::updatePhase() {
  Phase newPhase;
  if (ticker.isActive()) {
    newPhase = direction == Direction::Forward ? Phase::AnimatingForward : Phase::AnimatingReverse;
  } else if (currentValue == 0.0f) {
    newPhase = Phase::Dismissed;
  } else if (currentValue == 1.0f) {
    newPhase = Phase::Completed;
  } else {
    newPhase = direction == Direction::Forward ? Phase::AnimatingForward : Phase::AnimatingReverse;
  }

  if (newPhase != currentPhase) {
    SPDLOG_LOGGER_DEBUG(logger, "Phase {} -> {}", magic_enum::enum_name(currentPhase), magic_enum::enum_name(newPhase));
    currentPhase = newPhase;
    phaseListeners->call(currentPhase);
  }
}

} // namespace drawer::anim
