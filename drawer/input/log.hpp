#ifndef C86497FE_37E8_47B0_8676_96170904B881
#define C86497FE_37E8_47B0_8676_96170904B881

#include "../log/log.hpp"

namespace drawer::input {
inline logging::Logger getLogger() { return logging::getSubsystemLogger("input", spdlog::level::info); }
} // namespace drawer::input

#endif /* C86497FE_37E8_47B0_8676_96170904B881 */
