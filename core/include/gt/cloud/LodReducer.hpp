#pragma once
#include "gt/cloud/PointCloudFrame.hpp"
#include <cstdint>

namespace gt {

// Uniform index-stride subsample. Frames within budget come back unchanged;
// otherwise stride = ceil(n / budget) and floor(n / stride) points are kept
// in original order. A budget of 0 yields an empty frame.
PointCloudFrame reduceToBudget(const PointCloudFrame& frame, std::uint32_t budget);

std::uint32_t lodStride(std::uint32_t numPoints, std::uint32_t budget);

} // namespace gt
