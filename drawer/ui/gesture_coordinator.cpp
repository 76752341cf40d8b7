#include "gesture_coordinator.hpp"
#include "log.hpp"
#include "../core/error_utils.hpp"
#include "../input/debug.hpp"
#include <magic_enum.hpp>
#include <cmath>

namespace drawer::ui {
using anim::Phase;

static auto logger = getLogger();

void GestureConfig::validate() const {
  if (!(minDragStartEdge >= 0.0f))
    throw formatConfigurationError("Drag start edge must not be negative, got {}", minDragStartEdge);
  if (!(closeDragEdge >= 0.0f))
    throw formatConfigurationError("Close drag edge must not be negative, got {}", closeDragEdge);
  if (!(minFlingVelocity > 0.0f))
    throw formatConfigurationError("Minimum fling velocity must be positive, got {}", minFlingVelocity);
}

DrawerGestureCoordinator::DrawerGestureCoordinator(anim::ProgressController &controller, GestureConfig config)
    : controller(controller), config(config) {
  config.validate();
}

void DrawerGestureCoordinator::setLayout(float availableWidth_, float offsetFromRight_) {
  availableWidth = availableWidth_;
  offsetFromRight = offsetFromRight_;
}

void DrawerGestureCoordinator::setConfig(GestureConfig newConfig) {
  newConfig.validate();
  config = newConfig;
}

void DrawerGestureCoordinator::reset() {
  if (session)
    SPDLOG_LOGGER_DEBUG(logger, "Dropping drag session started at {}", session->startPositionX);
  session.reset();
}

bool DrawerGestureCoordinator::canStartDrag(float startX) const {
  bool isDragOpenFromLeft = controller.isDismissed() && startX < config.minDragStartEdge;
  bool isDragCloseFromRight = controller.isCompleted() && startX > getMaxSlide() - config.closeDragEdge;
  return isDragOpenFromLeft || isDragCloseFromRight;
}

void DrawerGestureCoordinator::dragStart(const input::DragStartEvent &event) {
  session = GestureSession{
      .draggable = canStartDrag(event.position.x),
      .startPositionX = event.position.x,
  };
  SPDLOG_LOGGER_DEBUG(logger, "Drag start at {} ({}), draggable: {}", event.position.x,
                      magic_enum::enum_name(controller.phase()), session->draggable);
}

void DrawerGestureCoordinator::dragUpdate(const input::DragUpdateEvent &event) {
  if (!session) {
    SPDLOG_LOGGER_DEBUG(logger, "Ignoring drag update without drag start");
    return;
  }
  if (!session->draggable)
    return;

  float maxSlide = getMaxSlide();
  if (!(maxSlide > 0.0f)) {
    SPDLOG_LOGGER_DEBUG(logger, "Ignoring drag update, no room to slide (width: {})", availableWidth);
    return;
  }

  controller.addProgress(event.primaryDelta / maxSlide);
}

void DrawerGestureCoordinator::dragEnd(const input::DragEndEvent &event) {
  if (!session) {
    SPDLOG_LOGGER_DEBUG(logger, "Ignoring drag end without drag start");
    return;
  }
  session.reset();

  if (controller.isDismissed() || controller.isCompleted())
    return;

  float velocityX = event.velocity.x;
  if (std::abs(velocityX) >= config.minFlingVelocity && availableWidth > 0.0f) {
    float visualVelocity = velocityX / availableWidth;
    SPDLOG_LOGGER_DEBUG(logger, "Drag released at {} with {}/s, fling {}", controller.value(), velocityX, visualVelocity);
    controller.flingTo(visualVelocity);
  } else if (controller.value() < 0.5f) {
    SPDLOG_LOGGER_DEBUG(logger, "Drag released at {}, snap closed", controller.value());
    controller.close();
  } else {
    SPDLOG_LOGGER_DEBUG(logger, "Drag released at {}, snap open", controller.value());
    controller.open();
  }
}

void DrawerGestureCoordinator::handle(const input::DragEvent &event) {
  SPDLOG_LOGGER_TRACE(logger, "Drag event: {}", input::debugFormat(event));
  std::visit(
      [&](auto &&arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, input::DragStartEvent>) {
          dragStart(arg);
        } else if constexpr (std::is_same_v<T, input::DragUpdateEvent>) {
          dragUpdate(arg);
        } else if constexpr (std::is_same_v<T, input::DragEndEvent>) {
          dragEnd(arg);
        }
      },
      event);
}

} // namespace drawer::ui
