#include "config.hpp"
#include "../core/error_utils.hpp"
#include <cmath>

namespace drawer::ui {

static void validateGradient(const LinearGradient &gradient) {
  if (gradient.colors.size() < 2)
    throw formatConfigurationError("Gradient needs at least 2 colors, got {}", gradient.colors.size());
  if (gradient.stops.empty())
    return;
  if (gradient.stops.size() != gradient.colors.size())
    throw formatConfigurationError("Gradient has {} colors but {} stops", gradient.colors.size(), gradient.stops.size());

  float previous = 0.0f;
  for (size_t i = 0; i < gradient.stops.size(); i++) {
    float stop = gradient.stops[i];
    if (!(stop >= previous && stop <= 1.0f))
      throw formatConfigurationError("Gradient stop {} ({}) is out of order or outside [0,1]", i, stop);
    previous = stop;
  }
}

void DrawerConfig::validate() const {
  animation.validate();
  gestures.validate();
  if (!(offsetFromRight >= 0.0f))
    throw formatConfigurationError("Offset from right must not be negative, got {}", offsetFromRight);
  if (!std::isfinite(rotateAngle))
    throw formatConfigurationError("Rotate angle must be finite, got {}", rotateAngle);
  if (backgroundGradient)
    validateGradient(*backgroundGradient);
}

TransformConfig DrawerConfig::getTransformConfig() const {
  TransformConfig transform;
  transform.isRotate = isRotate;
  transform.rotateAngle = rotateAngle;
  return transform;
}

Background resolveBackground(const DrawerConfig &config, const Theme &theme) {
  if (config.backgroundGradient)
    return *config.backgroundGradient;
  if (config.backgroundColor)
    return *config.backgroundColor;
  return theme.primaryColor;
}

Brightness resolveBrightness(const DrawerConfig &config, const Theme &theme) {
  return config.brightness.value_or(theme.primaryBrightness);
}

} // namespace drawer::ui
