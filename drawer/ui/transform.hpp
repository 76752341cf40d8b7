#ifndef F2BC2B67_0BA2_49D1_84B6_4382845C1AD6
#define F2BC2B67_0BA2_49D1_84B6_4382845C1AD6

#include "../anim/progress_controller.hpp"
#include "../core/linalg.hpp"
#include "../core/math.hpp"

namespace drawer::ui {

struct TransformConfig {
  bool isRotate = true;
  // Rotation about the vertical axis when fully open, in radians
  float rotateAngle = pi / 24.0f;
  // Scale is reduced by this much when fully open
  float scaleReduction = 0.25f;
  float perspective = 0.001f;
  float cornerRadius = 20.0f;
  float elevation = 6.0f;
};

// Everything the renderer needs to place the primary content for a progress value
struct DrawerTransform {
  float translationX{};
  float scale = 1.0f;
  float rotationY{};
  // Column major, includes the perspective term and the pivot at the left edge center
  float4x4 matrix = linalg::identity;
  bool roundCorners{};
  bool blockContentPointer{};
  float cornerRadius{};
  float elevation{};
};

// The content pivots around the vertical center of its left edge, viewHeight is used to locate it
DrawerTransform computeTransform(float value, anim::Phase phase, float maxSlide, float viewHeight,
                                 const TransformConfig &config);

float4x4 rotationYMatrix(float angle);

} // namespace drawer::ui

#endif /* F2BC2B67_0BA2_49D1_84B6_4382845C1AD6 */
