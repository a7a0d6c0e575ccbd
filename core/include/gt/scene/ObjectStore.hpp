#pragma once
#include "gt/ids/Id.hpp"
#include "gt/interaction/HandLabel.hpp"
#include "gt/math/Vec.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace gt {

enum class ObjectKind : std::uint8_t {
  Circle = 1,
  Square,
  Triangle,
  Star,
  Hexagon,
  Diamond,
  Sphere,
  Cube,
  Cone,
  Torus,
  Detected // backed by an external object detection
};

const char* objectKindName(ObjectKind k);
bool parseObjectKind(const std::string& s, ObjectKind& out);

struct InteractiveObject {
  ObjectId id{kNoObject};
  ObjectKind kind{ObjectKind::Square};
  std::string label;

  // Untransformed footprint on the surface, in pixels.
  Rect anchorBox;

  bool has3d{false};
  Vec3 position3d; // meters, before offset3d

  // Accumulated manipulation.
  Vec2 offset;
  Vec3 offset3d;
  float rotationDeg{0};
  float scale{1.0f};

  std::uint32_t color{0xFFFFFFu}; // 0xRRGGBB

  // Arbitration, owned by the store.
  bool locked{false};
  HandLabel lockedBy{HandLabel::Left};
  bool selected{false};
  HandLabel selectedBy{HandLabel::Left};

  // Detection-backed objects only.
  int classId{-1};
  float confidence{0};
  std::uint64_t lastSeenTick{0};

  Vec2 center() const { return anchorBox.center() + offset; }
  Vec3 worldPosition() const { return position3d + offset3d; }

  // Scaled box around the current center, ignoring rotation.
  Rect bounds() const {
    Vec2 c = center();
    float w = anchorBox.width * scale;
    float h = anchorBox.height * scale;
    return {c.x - w * 0.5f, c.y - h * 0.5f, w, h};
  }
};

enum class LockOutcome : std::uint8_t { Granted, Denied, Missing };

class ObjectStore {
public:
  static constexpr float kMinScale = 0.05f;
  static constexpr float kMaxScale = 20.0f;

  // Creates an object whose footprint of the given size is centered at
  // initialPosition.
  ObjectId add(ObjectKind kind, Vec2 initialPosition, Vec2 size = {100.0f, 100.0f});
  ObjectId add3d(ObjectKind kind, Vec3 position, const Rect& footprint);
  // Inserts a copy of proto with a fresh id; arbitration fields are reset.
  ObjectId insert(const InteractiveObject& proto);

  bool remove(ObjectId id);
  void clear();

  const InteractiveObject* get(ObjectId id) const;
  const std::vector<InteractiveObject>& list() const { return objects_; }
  std::size_t count() const { return objects_.size(); }

  // Mutators return false (no-op) when id is not present.
  bool applyOffset(ObjectId id, Vec2 delta);
  bool applyOffset3d(ObjectId id, Vec3 delta);
  bool applyRotation(ObjectId id, float deltaDegrees);
  bool applyScale(ObjectId id, float factor);
  bool setColor(ObjectId id, std::uint32_t rgb);

  // Detection refresh: moves the anchor, keeps manipulation state.
  bool refreshDetection(ObjectId id, const Rect& box, float confidence,
                        std::uint64_t tick);

  // ---- arbitration ----
  // Re-locking by the current owner is granted.
  LockOutcome tryLock(ObjectId id, HandLabel hand);
  bool unlock(ObjectId id, HandLabel hand);
  bool lockOwner(ObjectId id, HandLabel& out) const;

  // Marks id as selected by hand. If another hand held the selection,
  // previousOwner is set and true is returned.
  bool claimSelection(ObjectId id, HandLabel hand, HandLabel& previousOwner);
  void releaseSelection(ObjectId id, HandLabel hand);

  // Drops every lock and selection held by hand.
  void releaseAll(HandLabel hand);

  std::string toJSON() const;
  static void writeObject(rapidjson::Writer<rapidjson::StringBuffer>& w,
                          const InteractiveObject& o);

private:
  InteractiveObject* find(ObjectId id);

  std::vector<InteractiveObject> objects_;
  ObjectId nextId_{1};
};

} // namespace gt
