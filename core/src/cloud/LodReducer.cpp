#include "gt/cloud/LodReducer.hpp"

namespace gt {

std::uint32_t lodStride(std::uint32_t numPoints, std::uint32_t budget) {
  if (budget == 0 || numPoints <= budget) return 1;
  return static_cast<std::uint32_t>(
      (static_cast<std::uint64_t>(numPoints) + budget - 1) / budget);
}

PointCloudFrame reduceToBudget(const PointCloudFrame& frame, std::uint32_t budget) {
  if (frame.numPoints <= budget) return frame;

  PointCloudFrame out;
  out.hasColors = frame.hasColors;
  out.quantized = frame.quantized;
  out.compressed = frame.compressed;
  out.bounds = frame.bounds;
  if (budget == 0) return out;

  std::uint32_t stride = lodStride(frame.numPoints, budget);
  std::uint32_t kept = frame.numPoints / stride;

  out.positions.reserve(kept);
  if (frame.hasColors) out.colors.reserve(kept);
  for (std::uint32_t i = 0; i < kept; ++i) {
    std::size_t src = static_cast<std::size_t>(i) * stride;
    out.positions.push_back(frame.positions[src]);
    if (frame.hasColors) out.colors.push_back(frame.colors[src]);
  }
  out.numPoints = kept;
  return out;
}

} // namespace gt
