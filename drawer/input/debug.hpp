#ifndef EE6896B7_BC52_498F_B2D8_FE771E8ACEEE
#define EE6896B7_BC52_498F_B2D8_FE771E8ACEEE

#include "events.hpp"
#include "../core/fmt.hpp"
#include <spdlog/fmt/fmt.h>
#include <string>
#include <type_traits>

namespace drawer::input {

inline std::string debugFormat(const DragEvent &event) {
  return std::visit(
      [&](auto &&arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DragStartEvent>) {
          return fmt::format("DragStartEvent {{ position: {} }}", arg.position);
        } else if constexpr (std::is_same_v<T, DragUpdateEvent>) {
          return fmt::format("DragUpdateEvent {{ position: {}, primaryDelta: {} }}", arg.position, arg.primaryDelta);
        } else if constexpr (std::is_same_v<T, DragEndEvent>) {
          return fmt::format("DragEndEvent {{ velocity: {} }}", arg.velocity);
        } else {
          return fmt::format("UnknownEvent {{}}");
        }
      },
      event);
}

inline std::string debugFormat(const PointerEvent &event) {
  return std::visit(
      [&](auto &&arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, PointerButtonEvent>) {
          return fmt::format("PointerButtonEvent {{ index: {}, pressed: {}, pos: {}, time: {} }}", arg.index, arg.pressed,
                             arg.pos, arg.time);
        } else if constexpr (std::is_same_v<T, PointerMoveEvent>) {
          return fmt::format("PointerMoveEvent {{ pos: {}, delta: {}, time: {} }}", arg.pos, arg.delta, arg.time);
        } else {
          return fmt::format("UnknownEvent {{}}");
        }
      },
      event);
}

} // namespace drawer::input

#endif /* EE6896B7_BC52_498F_B2D8_FE771E8ACEEE */
