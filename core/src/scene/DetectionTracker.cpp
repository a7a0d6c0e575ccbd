#include "gt/scene/DetectionTracker.hpp"

#include <algorithm>

namespace gt {

DetectionUpdateResult DetectionTracker::update(
    const std::vector<Detection>& detections, std::uint64_t tick,
    ObjectStore& store) {
  DetectionUpdateResult result;
  std::vector<ObjectId> matched;

  for (const auto& det : detections) {
    ObjectId best = kNoObject;
    float bestDist = cfg_.matchDistance;
    for (const auto& o : store.list()) {
      if (o.kind != ObjectKind::Detected || o.classId != det.classId) continue;
      if (std::find(matched.begin(), matched.end(), o.id) != matched.end()) continue;
      float d = length(o.anchorBox.center() - det.center);
      if (d <= bestDist) {
        bestDist = d;
        best = o.id;
      }
    }

    if (best != kNoObject) {
      store.refreshDetection(best, det.bbox, det.confidence, tick);
      matched.push_back(best);
      result.refreshed.push_back(best);
      continue;
    }

    InteractiveObject o;
    o.kind = ObjectKind::Detected;
    o.label = det.className;
    o.classId = det.classId;
    o.confidence = det.confidence;
    o.anchorBox = det.bbox;
    o.lastSeenTick = tick;
    ObjectId id = store.insert(o);
    matched.push_back(id);
    result.created.push_back(id);
  }

  std::vector<ObjectId> expired;
  for (const auto& o : store.list()) {
    if (o.kind != ObjectKind::Detected || o.locked || o.selected) continue;
    if (tick > o.lastSeenTick && tick - o.lastSeenTick > cfg_.staleTicks) {
      expired.push_back(o.id);
    }
  }
  for (ObjectId id : expired) {
    store.remove(id);
    result.removed.push_back(id);
  }
  return result;
}

} // namespace gt
