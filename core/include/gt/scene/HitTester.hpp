#pragma once
#include "gt/ids/Id.hpp"
#include "gt/math/Vec.hpp"
#include "gt/scene/ObjectStore.hpp"

#include <vector>

namespace gt {

// A hand's pointer in object space. world is only valid when has3d.
struct Cursor {
  Vec2 surface;
  bool has3d{false};
  Vec3 world;
};

struct HitConfig {
  float hoverMargin{30.0f};   // px grown on every side of a 2-D footprint
  bool use3d{false};          // sphere test for objects with a 3-D position
  float hitRadius3d{0.05f};   // meters, multiplied by object scale
};

// Read-only. Returns kNoObject when nothing is under the cursor; when
// several objects overlap, the most recently created (highest id) wins.
ObjectId hitTest(const Cursor& cursor, const std::vector<InteractiveObject>& objects,
                 const HitConfig& cfg);

// Containment against a single object's transformed region.
bool hitsObject(const Cursor& cursor, const InteractiveObject& obj,
                const HitConfig& cfg);

} // namespace gt
