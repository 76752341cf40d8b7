#include "transform.hpp"
#include <cmath>

namespace drawer::ui {

float4x4 rotationYMatrix(float angle) {
  float c = std::cos(angle);
  float s = std::sin(angle);
  return float4x4{
      float4{c, 0.0f, -s, 0.0f},
      float4{0.0f, 1.0f, 0.0f, 0.0f},
      float4{s, 0.0f, c, 0.0f},
      float4{0.0f, 0.0f, 0.0f, 1.0f},
  };
}

DrawerTransform computeTransform(float value, anim::Phase phase, float maxSlide, float viewHeight,
                                 const TransformConfig &config) {
  DrawerTransform result;
  result.translationX = maxSlide * value;
  result.scale = 1.0f - config.scaleReduction * value;
  result.rotationY = config.isRotate ? value * config.rotateAngle : 0.0f;

  float4x4 m = linalg::mul(linalg::translation_matrix(float3(result.translationX, 0.0f, 0.0f)),
                           linalg::scaling_matrix(float3(result.scale)));
  if (config.isRotate) {
    m[2][3] = config.perspective;
    m = linalg::mul(m, rotationYMatrix(result.rotationY));
  }

  float3 pivot(0.0f, viewHeight * 0.5f, 0.0f);
  result.matrix = linalg::mul(linalg::translation_matrix(pivot), linalg::mul(m, linalg::translation_matrix(-pivot)));

  bool open = phase == anim::Phase::Completed;
  result.roundCorners = open;
  result.blockContentPointer = open;
  result.cornerRadius = open ? config.cornerRadius : 0.0f;
  result.elevation = config.elevation;
  return result;
}

} // namespace drawer::ui
