#include "gestures.hpp"
#include "debug.hpp"
#include "log.hpp"
#include <magic_enum.hpp>
#include <cmath>

namespace drawer::input {

static auto logger = getLogger();

DragEvents HorizontalDragRecognizer::update(const PointerEvent &event) {
  SPDLOG_LOGGER_TRACE(logger, "Drag recognizer ({}) input: {}", magic_enum::enum_name(state), debugFormat(event));
  return std::visit(
      [&](auto &&arg) -> DragEvents {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, PointerButtonEvent>) {
          return onButton(arg);
        } else {
          return onMove(arg);
        }
      },
      event);
}

void HorizontalDragRecognizer::reset() {
  state = State::Idle;
  velocityTracker.reset();
}

DragEvents HorizontalDragRecognizer::onButton(const PointerButtonEvent &event) {
  DragEvents out;
  if (event.pressed) {
    // Ignore extra fingers while one is being tracked
    if (state != State::Idle)
      return out;

    state = State::Possible;
    pointerIndex = event.index;
    downPosition = event.pos;
    lastPosition = event.pos;
    velocityTracker.reset();
    velocityTracker.addPosition(event.time, event.pos);
    return out;
  }

  if (state == State::Idle || event.index != pointerIndex)
    return out;

  if (state == State::Accepted) {
    velocityTracker.addPosition(event.time, event.pos);
    float2 velocity = velocityTracker.getVelocity();
    SPDLOG_LOGGER_DEBUG(logger, "Drag ended with velocity {}", velocity);
    out.push_back(DragEndEvent{.velocity = velocity});
  } else {
    SPDLOG_LOGGER_DEBUG(logger, "Pointer released before passing the touch slop");
  }
  state = State::Idle;
  return out;
}

DragEvents HorizontalDragRecognizer::onMove(const PointerMoveEvent &event) {
  DragEvents out;
  switch (state) {
  case State::Idle:
    break;
  case State::Possible: {
    velocityTracker.addPosition(event.time, event.pos);
    float travel = event.pos.x - downPosition.x;
    if (std::abs(travel) > touchSlop) {
      SPDLOG_LOGGER_DEBUG(logger, "Drag accepted at {} (down at {})", event.pos, downPosition);
      state = State::Accepted;
      out.push_back(DragStartEvent{.position = downPosition});
      out.push_back(DragUpdateEvent{.position = event.pos, .primaryDelta = travel});
      lastPosition = event.pos;
    }
    break;
  }
  case State::Accepted:
    velocityTracker.addPosition(event.time, event.pos);
    out.push_back(DragUpdateEvent{.position = event.pos, .primaryDelta = event.pos.x - lastPosition.x});
    lastPosition = event.pos;
    break;
  }
  return out;
}

} // namespace drawer::input
