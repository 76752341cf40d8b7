#ifndef C649E99B_888C_4176_8264_CD78C8310CB2
#define C649E99B_888C_4176_8264_CD78C8310CB2

#include "events.hpp"
#include "velocity_tracker.hpp"
#include <boost/container/small_vector.hpp>
#include <optional>

namespace drawer::input {

typedef boost::container::small_vector<DragEvent, 2> DragEvents;

// Turns raw pointer input into horizontal drag events
//  a press only becomes a drag once it moved horizontally past the touch slop
struct HorizontalDragRecognizer {
  enum class State { Idle, Possible, Accepted };

  float touchSlop = 18.0f;
  VelocityTracker velocityTracker;

  // Returns the drag events produced by this pointer event
  DragEvents update(const PointerEvent &event);
  void reset();

  State getState() const { return state; }

private:
  State state = State::Idle;
  int pointerIndex{};
  float2 downPosition{};
  float2 lastPosition{};

  DragEvents onButton(const PointerButtonEvent &event);
  DragEvents onMove(const PointerMoveEvent &event);
};

} // namespace drawer::input

#endif /* C649E99B_888C_4176_8264_CD78C8310CB2 */
