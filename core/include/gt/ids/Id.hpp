#pragma once
#include <cstdint>

namespace gt {

using ObjectId = std::uint32_t;

inline constexpr ObjectId kNoObject = 0;

} // namespace gt
