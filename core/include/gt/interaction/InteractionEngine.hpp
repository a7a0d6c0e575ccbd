#pragma once
#include "gt/events/EventLog.hpp"
#include "gt/interaction/HandInteraction.hpp"
#include "gt/interaction/HandObservation.hpp"
#include "gt/scene/DemoObjects.hpp"
#include "gt/scene/DetectionTracker.hpp"
#include "gt/scene/ObjectStore.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <vector>

namespace gt {

struct InteractionStats {
  std::uint64_t hovers{0};
  std::uint64_t selections{0}; // lock acquired from hover or selecting
  std::uint64_t drags{0};
  std::uint64_t rotations{0};
  std::uint64_t scales{0};
  std::uint64_t menus{0};
  std::uint64_t lockDenials{0};
  std::uint64_t timeouts{0};
  std::uint64_t lostTargets{0};
};

struct TickInput {
  std::int64_t timestampMs{0};
  std::vector<HandObservation> hands; // hands absent from the list were not seen
  bool hasDetections{false};
  std::vector<Detection> detections;
};

// Immutable view of the engine after a committed tick.
struct InteractionSnapshot {
  std::uint64_t tick{0};
  std::int64_t timestampMs{0};
  std::vector<InteractiveObject> objects;
  std::array<HandState, kHandCount> hands;
  InteractionStats stats;
};

struct TickResult {
  std::shared_ptr<const InteractionSnapshot> snapshot;
  std::vector<InteractionEvent> events; // appended during this tick, in order
};

// Owns the object store and both hands. Single writer: advance() and the
// request methods must all be called from the tick thread.
class InteractionEngine {
public:
  explicit InteractionEngine(const InteractionConfig& cfg = {},
                             std::size_t eventCapacity = 256);

  void setConfig(const InteractionConfig& cfg) { config_ = cfg; }
  const InteractionConfig& config() const { return config_; }

  void setDetectionTracking(bool enabled, const DetectionTrackerConfig& cfg);
  // Overrides mapCursor() (calibration collaborator).
  void setCursorMapper(CursorMapper mapper) { mapper_ = std::move(mapper); }

  // One tick. Hands are processed Left then Right.
  TickResult advance(const TickInput& input);

  // Requests applied between ticks. Events they cause are returned and
  // also logged.
  // Replaces the previous demo batch; hands holding one of its ids lose
  // their target on the next update.
  std::vector<ObjectId> addDemoObjects(DemoSet set);
  void clearObjects();
  std::vector<InteractionEvent> resetAllHands(EventType reason = EventType::HandReset);

  std::shared_ptr<const InteractionSnapshot> snapshot() const;

  ObjectStore& store() { return store_; }
  const ObjectStore& store() const { return store_; }
  const EventLog& eventLog() const { return log_; }
  const HandState& hand(HandLabel h) const { return hands_[handIndex(h)].state(); }
  const InteractionStats& stats() const { return stats_; }
  std::uint64_t tick() const { return tick_; }

private:
  void commit(std::vector<InteractionEvent>& events);
  void settleSelections(std::size_t after, std::vector<InteractionEvent>& events);

  InteractionConfig config_;
  ObjectStore store_;
  std::array<HandInteraction, kHandCount> hands_;
  EventLog log_;
  InteractionStats stats_;
  CursorMapper mapper_;
  std::vector<ObjectId> demoIds_;

  bool trackDetections_{false};
  DetectionTracker tracker_;

  std::uint64_t tick_{0};
  std::int64_t timestampMs_{0};
};

} // namespace gt
