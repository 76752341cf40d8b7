#ifndef AD1DCD79_B840_48F8_AB7F_652128515075
#define AD1DCD79_B840_48F8_AB7F_652128515075

#include "../core/callback.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace drawer::anim {

// Invoked once per frame with the seconds elapsed since the previous frame
typedef CallbackHandle<float> FrameCallbackHandle;

// Source of frame callbacks, usually the host render loop
//  releasing the returned handle unregisters the callback before the next frame
struct IFrameScheduler {
  virtual ~IFrameScheduler() = default;
  virtual FrameCallbackHandle registerFrameCallback(std::function<void(float)> callback) = 0;
};

// Frame scheduler pumped explicitly by the owner
struct ManualFrameScheduler final : public IFrameScheduler {
  ManualFrameScheduler();

  FrameCallbackHandle registerFrameCallback(std::function<void(float)> callback) override;

  // Runs a single frame
  void tick(float deltaSeconds);

  // Runs frames until no callbacks remain, returns the number of frames that ran
  size_t runUntilIdle(float deltaSeconds, size_t maxFrames = 100000);

  bool hasCallbacks() const { return registry->size() > 0; }
  size_t getNumCallbacks() const { return registry->size(); }
  uint64_t getFrameCount() const { return frameCount; }

private:
  std::shared_ptr<CallbackRegistry<float>> registry;
  uint64_t frameCount{};
};

// Calls back every frame with the time elapsed since start() while active
struct Ticker {
  typedef std::function<void(float)> TickCallback;

  Ticker(IFrameScheduler &scheduler, TickCallback onTick);
  Ticker(const Ticker &) = delete;
  Ticker &operator=(const Ticker &) = delete;

  void start();
  void stop();
  bool isActive() const { return (bool)handle; }
  float getElapsed() const { return elapsed; }

private:
  IFrameScheduler &scheduler;
  TickCallback onTick;
  FrameCallbackHandle handle;
  float elapsed{};
  uint64_t generation{};

  void onFrame(uint64_t frameGeneration, float deltaSeconds);
};

} // namespace drawer::anim

#endif /* AD1DCD79_B840_48F8_AB7F_652128515075 */
