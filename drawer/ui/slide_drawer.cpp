#include "slide_drawer.hpp"
#include "log.hpp"
#include <magic_enum.hpp>

namespace drawer::ui {

static auto logger = getLogger();

static const DrawerConfig &validated(const DrawerConfig &config) {
  config.validate();
  return config;
}

SlideDrawer::SlideDrawer(anim::IFrameScheduler &scheduler, DrawerConfig config_, DrawerSlots slots_)
    : config(validated(config_)), slots(std::make_shared<const DrawerSlots>(std::move(slots_))), controller(scheduler, config.animation),
      coordinator(controller, config.gestures) {
  coordinator.setLayout(viewSize.x, config.offsetFromRight);
}

void SlideDrawer::setViewSize(float2 size) {
  viewSize = size;
  coordinator.setLayout(viewSize.x, config.offsetFromRight);
}

void SlideDrawer::handle(const input::DragEvent &event) { coordinator.handle(event); }

void SlideDrawer::handle(const input::PointerEvent &event) {
  for (auto &dragEvent : dragRecognizer.update(event)) {
    coordinator.handle(dragEvent);
  }
}

bool SlideDrawer::handleBack() {
  if (controller.isCompleted()) {
    SPDLOG_LOGGER_DEBUG(logger, "Back navigation closes the drawer");
    controller.close();
    return true;
  }
  return false;
}

bool SlideDrawer::tapContent() {
  if (controller.isCompleted()) {
    controller.close();
    return true;
  }
  return false;
}

void SlideDrawer::reconfigure(DrawerConfig newConfig) {
  newConfig.validate();
  config = std::move(newConfig);
  coordinator.setConfig(config.gestures);
  coordinator.setLayout(viewSize.x, config.offsetFromRight);
  controller.reset(config.animation);
  coordinator.reset();
  dragRecognizer.reset();
  SPDLOG_LOGGER_DEBUG(logger, "Reconfigured, phase: {}", magic_enum::enum_name(controller.phase()));
}

DrawerRenderState SlideDrawer::getRenderState() const {
  return DrawerRenderState{
      .value = controller.value(),
      .phase = controller.phase(),
      .transform = computeTransform(controller.value(), controller.phase(), coordinator.getMaxSlide(), viewSize.y,
                                    config.getTransformConfig()),
      .panel = resolvePanelContent(slots, config, theme),
  };
}

} // namespace drawer::ui
