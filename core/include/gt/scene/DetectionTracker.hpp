#pragma once
#include "gt/ids/Id.hpp"
#include "gt/math/Vec.hpp"
#include "gt/scene/ObjectStore.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gt {

// One object reported by the external detector for the current frame.
struct Detection {
  int classId{-1};
  std::string className;
  float confidence{0};
  Rect bbox;
  Vec2 center;
};

struct DetectionTrackerConfig {
  float matchDistance{100.0f};   // px between detection and object anchor centers
  std::uint32_t staleTicks{30};  // unseen longer than this -> removed
};

struct DetectionUpdateResult {
  std::vector<ObjectId> created;
  std::vector<ObjectId> refreshed;
  std::vector<ObjectId> removed;
};

// Keeps detection-backed objects in the store in step with the detector.
// Matching is greedy nearest-first per detection, same class only; each
// object matches at most one detection per update. Objects that are
// locked or selected are never expired.
class DetectionTracker {
public:
  explicit DetectionTracker(const DetectionTrackerConfig& cfg = {}) : cfg_(cfg) {}

  void setConfig(const DetectionTrackerConfig& cfg) { cfg_ = cfg; }
  const DetectionTrackerConfig& config() const { return cfg_; }

  DetectionUpdateResult update(const std::vector<Detection>& detections,
                               std::uint64_t tick, ObjectStore& store);

private:
  DetectionTrackerConfig cfg_;
};

} // namespace gt
