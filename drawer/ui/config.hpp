#ifndef D12D197B_0155_43AB_B63D_B29DEFEEB186
#define D12D197B_0155_43AB_B63D_B29DEFEEB186

#include "gesture_coordinator.hpp"
#include "transform.hpp"
#include "../anim/progress_controller.hpp"
#include "../core/linalg.hpp"
#include "../core/math.hpp"
#include <optional>
#include <variant>
#include <vector>

namespace drawer::ui {

// Vertical placement of the panel content
enum class Alignment { Start, Center };

enum class Brightness { Dark, Light };

// RGBA, components in [0,1]
typedef float4 Color;

struct LinearGradient {
  std::vector<Color> colors;
  // Empty for evenly spaced colors, otherwise one increasing stop per color
  std::vector<float> stops;
  float2 begin{0.0f, 0.5f};
  float2 end{1.0f, 0.5f};
};

typedef std::variant<Color, LinearGradient> Background;

// Host theme values used when the drawer doesn't specify its own styling
struct Theme {
  Color primaryColor{0.129f, 0.588f, 0.953f, 1.0f};
  Brightness primaryBrightness = Brightness::Dark;
};

struct DrawerConfig {
  anim::ProgressConfig animation;
  // Space left visible to the right of the panel, the content slides by width - offsetFromRight
  float offsetFromRight = 60.0f;
  bool isRotate = true;
  float rotateAngle = pi / 24.0f;
  Alignment alignment = Alignment::Start;
  // The gradient takes precedence over the color
  std::optional<Color> backgroundColor;
  std::optional<LinearGradient> backgroundGradient;
  std::optional<Brightness> brightness;
  GestureConfig gestures;

  // Throws ConfigurationError
  void validate() const;

  TransformConfig getTransformConfig() const;
};

Background resolveBackground(const DrawerConfig &config, const Theme &theme);
Brightness resolveBrightness(const DrawerConfig &config, const Theme &theme);

} // namespace drawer::ui

#endif /* D12D197B_0155_43AB_B63D_B29DEFEEB186 */
