#ifndef B8D89D60_801B_4C3E_AD0A_99963E169EFB
#define B8D89D60_801B_4C3E_AD0A_99963E169EFB

#include "../core/linalg.hpp"
#include <variant>

namespace drawer::input {
using namespace linalg::aliases;

// Horizontal drag gesture, as reported by the host gesture system
//  positions are in the same units as the available width
struct DragStartEvent {
  float2 position;

  bool operator==(const DragStartEvent &other) const = default;
};

struct DragUpdateEvent {
  float2 position;
  // Movement along the horizontal axis since the previous update
  float primaryDelta;

  bool operator==(const DragUpdateEvent &other) const = default;
};

struct DragEndEvent {
  // Release velocity in units per second
  float2 velocity;

  bool operator==(const DragEndEvent &other) const = default;
};

using DragEvent = std::variant<DragStartEvent, DragUpdateEvent, DragEndEvent>;

// Raw pointer input, time is in seconds on any monotonic clock
struct PointerButtonEvent {
  float2 pos;
  int index;
  bool pressed;
  double time;

  bool operator==(const PointerButtonEvent &other) const = default;
};

struct PointerMoveEvent {
  float2 pos;
  float2 delta;
  double time;

  bool operator==(const PointerMoveEvent &other) const = default;
};

using PointerEvent = std::variant<PointerButtonEvent, PointerMoveEvent>;

} // namespace drawer::input

#endif /* B8D89D60_801B_4C3E_AD0A_99963E169EFB */
