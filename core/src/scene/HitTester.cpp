#include "gt/scene/HitTester.hpp"

#include <cmath>

namespace gt {

static constexpr float kDegToRad = 3.14159265358979f / 180.0f;

bool hitsObject(const Cursor& cursor, const InteractiveObject& obj,
                const HitConfig& cfg) {
  if (cfg.use3d && cursor.has3d && obj.has3d) {
    float radius = cfg.hitRadius3d * obj.scale;
    return length(cursor.world - obj.worldPosition()) <= radius;
  }

  // Bring the cursor into the object's unrotated frame, then test the
  // scaled footprint grown by the hover margin.
  Vec2 c = obj.center();
  Vec2 d = cursor.surface - c;
  if (obj.rotationDeg != 0.0f) {
    float a = -obj.rotationDeg * kDegToRad;
    float ca = std::cos(a), sa = std::sin(a);
    d = {d.x * ca - d.y * sa, d.x * sa + d.y * ca};
  }

  float halfW = obj.anchorBox.width * obj.scale * 0.5f + cfg.hoverMargin;
  float halfH = obj.anchorBox.height * obj.scale * 0.5f + cfg.hoverMargin;
  return std::fabs(d.x) <= halfW && std::fabs(d.y) <= halfH;
}

ObjectId hitTest(const Cursor& cursor, const std::vector<InteractiveObject>& objects,
                 const HitConfig& cfg) {
  ObjectId best = kNoObject;
  for (const auto& obj : objects) {
    if (obj.id > best && hitsObject(cursor, obj, cfg)) best = obj.id;
  }
  return best;
}

} // namespace gt
