#pragma once
#include "gt/interaction/Gesture.hpp"
#include "gt/interaction/HandLabel.hpp"
#include "gt/math/Vec.hpp"
#include "gt/scene/HitTester.hpp"

#include <functional>

namespace gt {

// One tracked hand as reported for a single tick. Coordinates are camera
// pixels; position3d is meters when has3d.
struct HandObservation {
  HandLabel label{HandLabel::Left};
  Gesture gesture{Gesture::Unknown};
  float confidence{0};
  Rect bbox;
  Vec2 center;
  bool has3d{false};
  Vec3 position3d;
};

struct CursorMappingConfig {
  bool mirrorX{false};
  float frameWidth{640.0f};
  float frameHeight{480.0f};
};

// Supplied by the calibration collaborator to map observations into
// object space.
using CursorMapper = std::function<Cursor(const HandObservation&)>;

Cursor mapCursor(const HandObservation& obs, const CursorMappingConfig& cfg);

} // namespace gt
