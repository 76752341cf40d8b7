#ifndef C50E1325_F11C_4230_B897_F941DD1FC610
#define C50E1325_F11C_4230_B897_F941DD1FC610

#include "../log/log.hpp"

namespace drawer::ui {
// Gesture decisions are useful while integrating, debug by default
inline logging::Logger getLogger() { return logging::getSubsystemLogger("ui", spdlog::level::debug); }
} // namespace drawer::ui

#endif /* C50E1325_F11C_4230_B897_F941DD1FC610 */
