#include "scheduler.hpp"
#include "../core/error_utils.hpp"

namespace drawer::anim {

ManualFrameScheduler::ManualFrameScheduler() : registry(std::make_shared<CallbackRegistry<float>>()) {}

FrameCallbackHandle ManualFrameScheduler::registerFrameCallback(std::function<void(float)> callback) {
  return registry->add(std::move(callback));
}

void ManualFrameScheduler::tick(float deltaSeconds) {
  ++frameCount;
  registry->call(deltaSeconds);
}

size_t ManualFrameScheduler::runUntilIdle(float deltaSeconds, size_t maxFrames) {
  if (!(deltaSeconds > 0.0f))
    throw formatException("Frame delta must be positive, got {}", deltaSeconds);

  size_t numFrames{};
  while (hasCallbacks() && numFrames < maxFrames) {
    tick(deltaSeconds);
    ++numFrames;
  }
  return numFrames;
}

Ticker::Ticker(IFrameScheduler &scheduler, TickCallback onTick) : scheduler(scheduler), onTick(std::move(onTick)) {}

void Ticker::start() {
  stop();
  elapsed = 0.0f;
  uint64_t frameGeneration = ++generation;
  handle = scheduler.registerFrameCallback([this, frameGeneration](float dt) { onFrame(frameGeneration, dt); });
}

void Ticker::stop() {
  // Bumping the generation also silences a callback that is already queued for the current frame
  ++generation;
  handle.reset();
}

void Ticker::onFrame(uint64_t frameGeneration, float deltaSeconds) {
  if (frameGeneration != generation)
    return;
  elapsed += deltaSeconds;
  onTick(elapsed);
}

} // namespace drawer::anim
