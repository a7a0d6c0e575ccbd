#include "gt/scene/DemoObjects.hpp"

namespace gt {

bool parseDemoSet(const std::string& s, DemoSet& out) {
  if (s == "2d" || s == "shapes") { out = DemoSet::Shapes2d; return true; }
  if (s == "3d" || s == "primitives") { out = DemoSet::Primitives3d; return true; }
  return false;
}

const char* demoSetName(DemoSet s) {
  return s == DemoSet::Shapes2d ? "2d" : "3d";
}

struct FlatPreset {
  ObjectKind kind;
  float x, y;
  std::uint32_t color;
};

struct SolidPreset {
  ObjectKind kind;
  Vec3 position;
  float x, y;
  std::uint32_t color;
};

static const FlatPreset kFlat[] = {
  {ObjectKind::Circle,   80.0f,  80.0f,  0xFF6B6Bu},
  {ObjectKind::Square,   270.0f, 80.0f,  0x4ECDC4u},
  {ObjectKind::Triangle, 460.0f, 80.0f,  0xFFE66Du},
  {ObjectKind::Star,     80.0f,  280.0f, 0xA78BFAu},
  {ObjectKind::Hexagon,  270.0f, 280.0f, 0xF97316u},
  {ObjectKind::Diamond,  460.0f, 280.0f, 0x22C55Eu},
};

static const SolidPreset kSolid[] = {
  {ObjectKind::Sphere, {-0.15f, 0.08f, -0.10f}, 160.0f, 160.0f, 0xFF6B6Bu},
  {ObjectKind::Cube,   { 0.15f, 0.08f, -0.10f}, 400.0f, 160.0f, 0x4ECDC4u},
  {ObjectKind::Cone,   {-0.15f, 0.08f,  0.10f}, 160.0f, 320.0f, 0xFFE66Du},
  {ObjectKind::Torus,  { 0.15f, 0.08f,  0.10f}, 400.0f, 320.0f, 0xA78BFAu},
};

std::vector<ObjectId> addDemoObjects(ObjectStore& store, DemoSet set) {
  std::vector<ObjectId> ids;
  if (set == DemoSet::Shapes2d) {
    for (const auto& p : kFlat) {
      InteractiveObject o;
      o.kind = p.kind;
      o.label = objectKindName(p.kind);
      o.anchorBox = {p.x, p.y, 100.0f, 100.0f};
      o.color = p.color;
      ids.push_back(store.insert(o));
    }
  } else {
    for (const auto& p : kSolid) {
      ObjectId id = store.add3d(p.kind, p.position, {p.x, p.y, 80.0f, 80.0f});
      store.setColor(id, p.color);
      ids.push_back(id);
    }
  }
  return ids;
}

} // namespace gt
