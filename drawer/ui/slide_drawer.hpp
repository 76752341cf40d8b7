#ifndef A7D04E59_2C83_4F16_B3E8_61F9C2D57A0B
#define A7D04E59_2C83_4F16_B3E8_61F9C2D57A0B

#include "config.hpp"
#include "gesture_coordinator.hpp"
#include "panel_content.hpp"
#include "transform.hpp"
#include "../anim/progress_controller.hpp"
#include "../anim/scheduler.hpp"
#include "../input/events.hpp"
#include "../input/gestures.hpp"
#include <memory>

namespace drawer::ui {

struct DrawerRenderState {
  float value{};
  anim::Phase phase = anim::Phase::Dismissed;
  DrawerTransform transform;
  PanelContext panel;
};

// Side panel revealed by pushing the primary content aside
//  the host keeps this object and calls into it directly, it is not discovered implicitly
struct SlideDrawer {
  SlideDrawer(anim::IFrameScheduler &scheduler, DrawerConfig config = DrawerConfig{}, DrawerSlots slots = DrawerSlots{});
  SlideDrawer(const SlideDrawer &) = delete;
  SlideDrawer &operator=(const SlideDrawer &) = delete;

  void open() { controller.open(); }
  void close() { controller.close(); }
  void toggle() { controller.toggle(); }

  anim::Phase phase() const { return controller.phase(); }
  float value() const { return controller.value(); }

  // Size of the area shared by the panel and the content
  void setViewSize(float2 size);
  float2 getViewSize() const { return viewSize; }

  void handle(const input::DragEvent &event);
  // For hosts without their own drag recognition
  void handle(const input::PointerEvent &event);

  // Returns true when the back navigation was consumed to close the drawer
  bool handleBack();
  // Tap on the primary content, closes the drawer when fully open
  bool tapContent();

  // Validates, then applies the new configuration and returns to the closed state
  void reconfigure(DrawerConfig newConfig);
  // Render states taken earlier keep the previous slots
  void setSlots(DrawerSlots newSlots) { slots = std::make_shared<const DrawerSlots>(std::move(newSlots)); }
  void setTheme(const Theme &newTheme) { theme = newTheme; }

  DrawerRenderState getRenderState() const;

  const DrawerConfig &getConfig() const { return config; }
  anim::ProgressController &getController() { return controller; }
  const DrawerGestureCoordinator &getCoordinator() const { return coordinator; }

private:
  DrawerConfig config;
  std::shared_ptr<const DrawerSlots> slots;
  Theme theme;
  float2 viewSize{};
  anim::ProgressController controller;
  DrawerGestureCoordinator coordinator;
  input::HorizontalDragRecognizer dragRecognizer;
};

} // namespace drawer::ui

#endif /* A7D04E59_2C83_4F16_B3E8_61F9C2D57A0B */
