#ifndef F78F8414_4E22_4184_AFB2_FD2A0DE7A526
#define F78F8414_4E22_4184_AFB2_FD2A0DE7A526

#include "../anim/progress_controller.hpp"
#include "../input/events.hpp"
#include <optional>

namespace drawer::ui {

struct GestureConfig {
  // Drags opening the drawer must start left of this
  float minDragStartEdge = 60.0f;
  // Drags closing the drawer must start within this distance of the open edge (maxSlide)
  float closeDragEdge = 16.0f;
  // Releases at or above this horizontal speed fling, slower ones snap
  float minFlingVelocity = 365.0f;

  // Throws ConfigurationError
  void validate() const;
};

// State of a single drag, from drag start to drag end
struct GestureSession {
  bool draggable{};
  float startPositionX{};
};

// Decides which drags may move the drawer and turns them into controller calls
struct DrawerGestureCoordinator {
  DrawerGestureCoordinator(anim::ProgressController &controller, GestureConfig config = GestureConfig{});

  // Horizontal space the drawer lives in, the content slides at most availableWidth - offsetFromRight
  void setLayout(float availableWidth, float offsetFromRight);
  void setConfig(GestureConfig config);

  void dragStart(const input::DragStartEvent &event);
  void dragUpdate(const input::DragUpdateEvent &event);
  void dragEnd(const input::DragEndEvent &event);
  void handle(const input::DragEvent &event);
  // Drops the current session, updates and ends are ignored until the next drag start
  void reset();

  float getMaxSlide() const { return availableWidth - offsetFromRight; }
  float getAvailableWidth() const { return availableWidth; }
  const GestureConfig &getConfig() const { return config; }
  const std::optional<GestureSession> &getSession() const { return session; }

private:
  anim::ProgressController &controller;
  GestureConfig config;
  float availableWidth{};
  float offsetFromRight = 60.0f;
  std::optional<GestureSession> session;

  bool canStartDrag(float startX) const;
};

} // namespace drawer::ui

#endif /* F78F8414_4E22_4184_AFB2_FD2A0DE7A526 */
