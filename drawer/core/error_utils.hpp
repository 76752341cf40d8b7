#ifndef B7947EB1_3E93_4DDD_9611_1D9F487760F9
#define B7947EB1_3E93_4DDD_9611_1D9F487760F9

#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <utility>

namespace drawer {
// Invalid construction parameters (durations, curves, thresholds)
struct ConfigurationError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

template <typename... TArgs> std::runtime_error formatException(fmt::format_string<TArgs...> format, TArgs &&...args) {
  return std::runtime_error(fmt::format(format, std::forward<TArgs>(args)...));
}

template <typename... TArgs>
ConfigurationError formatConfigurationError(fmt::format_string<TArgs...> format, TArgs &&...args) {
  return ConfigurationError(fmt::format(format, std::forward<TArgs>(args)...));
}
} // namespace drawer

#endif /* B7947EB1_3E93_4DDD_9611_1D9F487760F9 */
