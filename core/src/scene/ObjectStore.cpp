#include "gt/scene/ObjectStore.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace gt {

struct KindName {
  ObjectKind kind;
  const char* name;
};

static const KindName kKindNames[] = {
  {ObjectKind::Circle, "circle"},     {ObjectKind::Square, "square"},
  {ObjectKind::Triangle, "triangle"}, {ObjectKind::Star, "star"},
  {ObjectKind::Hexagon, "hexagon"},   {ObjectKind::Diamond, "diamond"},
  {ObjectKind::Sphere, "sphere"},     {ObjectKind::Cube, "cube"},
  {ObjectKind::Cone, "cone"},         {ObjectKind::Torus, "torus"},
  {ObjectKind::Detected, "detected"},
};

const char* objectKindName(ObjectKind k) {
  for (const auto& kn : kKindNames) {
    if (kn.kind == k) return kn.name;
  }
  return "unknown";
}

bool parseObjectKind(const std::string& s, ObjectKind& out) {
  for (const auto& kn : kKindNames) {
    if (s == kn.name) { out = kn.kind; return true; }
  }
  return false;
}

ObjectId ObjectStore::add(ObjectKind kind, Vec2 initialPosition, Vec2 size) {
  InteractiveObject o;
  o.kind = kind;
  o.label = objectKindName(kind);
  o.anchorBox = {initialPosition.x - size.x * 0.5f,
                 initialPosition.y - size.y * 0.5f, size.x, size.y};
  return insert(o);
}

ObjectId ObjectStore::add3d(ObjectKind kind, Vec3 position, const Rect& footprint) {
  InteractiveObject o;
  o.kind = kind;
  o.label = objectKindName(kind);
  o.anchorBox = footprint;
  o.has3d = true;
  o.position3d = position;
  return insert(o);
}

ObjectId ObjectStore::insert(const InteractiveObject& proto) {
  InteractiveObject o = proto;
  o.id = nextId_++;
  o.locked = false;
  o.selected = false;
  if (!(o.scale > 0.0f)) o.scale = 1.0f;
  objects_.push_back(o);
  return o.id;
}

bool ObjectStore::remove(ObjectId id) {
  auto it = std::remove_if(objects_.begin(), objects_.end(),
      [id](const InteractiveObject& o) { return o.id == id; });
  if (it == objects_.end()) return false;
  objects_.erase(it, objects_.end());
  return true;
}

void ObjectStore::clear() {
  // Ids are never reused within a session.
  objects_.clear();
}

InteractiveObject* ObjectStore::find(ObjectId id) {
  for (auto& o : objects_) {
    if (o.id == id) return &o;
  }
  return nullptr;
}

const InteractiveObject* ObjectStore::get(ObjectId id) const {
  for (const auto& o : objects_) {
    if (o.id == id) return &o;
  }
  return nullptr;
}

bool ObjectStore::applyOffset(ObjectId id, Vec2 delta) {
  InteractiveObject* o = find(id);
  if (!o) return false;
  o->offset = o->offset + delta;
  return true;
}

bool ObjectStore::applyOffset3d(ObjectId id, Vec3 delta) {
  InteractiveObject* o = find(id);
  if (!o) return false;
  o->offset3d = o->offset3d + delta;
  return true;
}

bool ObjectStore::applyRotation(ObjectId id, float deltaDegrees) {
  InteractiveObject* o = find(id);
  if (!o) return false;
  if (!std::isfinite(deltaDegrees)) return true;
  float r = std::fmod(o->rotationDeg + deltaDegrees, 360.0f);
  if (r < 0.0f) r += 360.0f;
  o->rotationDeg = r;
  return true;
}

bool ObjectStore::applyScale(ObjectId id, float factor) {
  InteractiveObject* o = find(id);
  if (!o) return false;
  if (!(factor > 0.0f) || !std::isfinite(factor)) return true;
  o->scale = std::min(kMaxScale, std::max(kMinScale, o->scale * factor));
  return true;
}

bool ObjectStore::setColor(ObjectId id, std::uint32_t rgb) {
  InteractiveObject* o = find(id);
  if (!o) return false;
  o->color = rgb & 0xFFFFFFu;
  return true;
}

bool ObjectStore::refreshDetection(ObjectId id, const Rect& box, float confidence,
                                   std::uint64_t tick) {
  InteractiveObject* o = find(id);
  if (!o) return false;
  o->anchorBox = box;
  o->confidence = confidence;
  o->lastSeenTick = tick;
  return true;
}

// ---- arbitration ----

LockOutcome ObjectStore::tryLock(ObjectId id, HandLabel hand) {
  InteractiveObject* o = find(id);
  if (!o) return LockOutcome::Missing;
  if (o->locked && o->lockedBy != hand) return LockOutcome::Denied;
  o->locked = true;
  o->lockedBy = hand;
  return LockOutcome::Granted;
}

bool ObjectStore::unlock(ObjectId id, HandLabel hand) {
  InteractiveObject* o = find(id);
  if (!o || !o->locked || o->lockedBy != hand) return false;
  o->locked = false;
  return true;
}

bool ObjectStore::lockOwner(ObjectId id, HandLabel& out) const {
  const InteractiveObject* o = get(id);
  if (!o || !o->locked) return false;
  out = o->lockedBy;
  return true;
}

bool ObjectStore::claimSelection(ObjectId id, HandLabel hand,
                                 HandLabel& previousOwner) {
  InteractiveObject* o = find(id);
  if (!o) return false;
  bool displaced = o->selected && o->selectedBy != hand;
  if (displaced) previousOwner = o->selectedBy;
  o->selected = true;
  o->selectedBy = hand;
  return displaced;
}

void ObjectStore::releaseSelection(ObjectId id, HandLabel hand) {
  InteractiveObject* o = find(id);
  if (o && o->selected && o->selectedBy == hand) o->selected = false;
}

void ObjectStore::releaseAll(HandLabel hand) {
  for (auto& o : objects_) {
    if (o.locked && o.lockedBy == hand) o.locked = false;
    if (o.selected && o.selectedBy == hand) o.selected = false;
  }
}

// ---- serialization ----

void ObjectStore::writeObject(rapidjson::Writer<rapidjson::StringBuffer>& w,
                              const InteractiveObject& o) {
  w.StartObject();
  w.Key("id");    w.Uint(o.id);
  w.Key("kind");  w.String(objectKindName(o.kind));
  w.Key("label"); w.String(o.label.c_str());

  Rect b = o.bounds();
  w.Key("bbox");
  w.StartObject();
  w.Key("x");      w.Double(b.x);
  w.Key("y");      w.Double(b.y);
  w.Key("width");  w.Double(b.width);
  w.Key("height"); w.Double(b.height);
  w.EndObject();

  if (o.has3d) {
    Vec3 p = o.worldPosition();
    w.Key("position3d");
    w.StartArray();
    w.Double(p.x); w.Double(p.y); w.Double(p.z);
    w.EndArray();
  }

  w.Key("offset");
  w.StartArray();
  w.Double(o.offset.x); w.Double(o.offset.y);
  w.EndArray();
  w.Key("rotation"); w.Double(o.rotationDeg);
  w.Key("scale");    w.Double(o.scale);

  char hex[8];
  std::snprintf(hex, sizeof(hex), "#%06x", static_cast<unsigned>(o.color));
  w.Key("color"); w.String(hex);

  w.Key("lockedBy");
  if (o.locked) w.String(handLabelName(o.lockedBy)); else w.Null();
  w.Key("selectedBy");
  if (o.selected) w.String(handLabelName(o.selectedBy)); else w.Null();

  if (o.kind == ObjectKind::Detected) {
    w.Key("classId");    w.Int(o.classId);
    w.Key("confidence"); w.Double(o.confidence);
  }
  w.EndObject();
}

std::string ObjectStore::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("objects");
  w.StartArray();
  for (const auto& o : objects_) writeObject(w, o);
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

} // namespace gt
