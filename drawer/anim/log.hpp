#ifndef AC84FC96_2B39_48F6_9BDD_1774D7D97E7E
#define AC84FC96_2B39_48F6_9BDD_1774D7D97E7E

#include "../log/log.hpp"

namespace drawer::anim {
// Per frame ticks log at trace, keep the default quiet
inline logging::Logger getLogger() { return logging::getSubsystemLogger("anim", spdlog::level::info); }
} // namespace drawer::anim

#endif /* AC84FC96_2B39_48F6_9BDD_1774D7D97E7E */
