#pragma once
#include "gt/math/Vec.hpp"
#include <cstdint>
#include <vector>

namespace gt {

// Per-axis affine map from a 16-bit code back to meters:
// value = (q / 65535) * range + min
struct QuantizationBounds {
  Vec3 min;
  Vec3 range;
};

struct Rgb {
  float r{0}, g{0}, b{0}; // [0,1]
};

// One decoded point-cloud frame. positions.size() == numPoints, and
// colors.size() == numPoints when hasColors (empty otherwise).
struct PointCloudFrame {
  std::uint32_t numPoints{0};
  bool hasColors{false};
  bool quantized{false};
  bool compressed{false};
  std::vector<Vec3> positions;
  std::vector<Rgb> colors;

  // Only meaningful when quantized.
  QuantizationBounds bounds;

  bool empty() const { return numPoints == 0; }
};

} // namespace gt
