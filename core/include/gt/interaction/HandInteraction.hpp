#pragma once
#include "gt/events/EventLog.hpp"
#include "gt/ids/Id.hpp"
#include "gt/interaction/Gesture.hpp"
#include "gt/interaction/HandObservation.hpp"
#include "gt/scene/HitTester.hpp"
#include "gt/scene/ObjectStore.hpp"

#include <cstdint>
#include <vector>

namespace gt {

enum class HandMode : std::uint8_t {
  Idle = 0,
  Hover,
  Selecting,
  Selected,
  Dragging,
  Rotating,
  Scaling,
  Menu
};

const char* handModeName(HandMode m);

// True for the modes that hold the target's lock.
inline bool holdsLock(HandMode m) {
  return m == HandMode::Dragging || m == HandMode::Rotating || m == HandMode::Scaling;
}

struct AreaZoomConfig {
  bool enabled{true};
  float baselineArea{15000.0f}; // grab-time hand area (px^2) when none is reported
  float minScale{0.5f};
  float maxScale{2.5f};
  float smoothing{0.15f};       // fraction of the gap closed per tick
};

struct InteractionConfig {
  GestureMode gestureMode{GestureMode::Stable};
  HitConfig hit;
  AreaZoomConfig areaZoom;
  std::uint32_t handTimeoutTicks{3};
  std::uint32_t grabConfirmTicks{0};
  CursorMappingConfig cursor;
};

struct HandState {
  HandLabel label{HandLabel::Left};
  bool present{false};
  Cursor cursor;
  Gesture gesture{Gesture::Unknown};
  Intent intent{Intent::Release};
  HandMode mode{HandMode::Idle};
  ObjectId hovered{kNoObject};
  ObjectId selected{kNoObject};
  std::uint32_t missedTicks{0};
};

// Per-hand state machine. Emits exactly one event per transition into
// `events`; the engine stamps and logs them.
class HandInteraction {
public:
  explicit HandInteraction(HandLabel label);

  void update(const HandObservation& obs, const Cursor& cursor,
              ObjectStore& store, const InteractionConfig& cfg,
              std::vector<InteractionEvent>& events);

  // Releases every lock and selection and returns to idle. Emits `reason`
  // if the hand was doing anything.
  void reset(ObjectStore& store, EventType reason,
             std::vector<InteractionEvent>& events);

  // Another hand claimed this hand's selected object.
  void loseSelection(ObjectStore& store, std::vector<InteractionEvent>& events);

  // Counts one unobserved tick; returns the new count.
  std::uint32_t markMissed() { return ++state_.missedTicks; }

  const HandState& state() const { return state_; }
  HandLabel label() const { return state_.label; }

private:
  void emit(EventType type, ObjectId id, std::vector<InteractionEvent>& events) const;
  bool resolveStale(const ObjectStore& store, std::vector<InteractionEvent>& events);
  void beginLocked(HandMode mode, ObjectId target, ObjectStore& store,
                   std::vector<InteractionEvent>& events);
  void endLocked(ObjectStore& store, std::vector<InteractionEvent>& events);
  void deselect(ObjectId hit, ObjectStore& store,
                std::vector<InteractionEvent>& events);

  void stepDrag(const HandObservation& obs, ObjectStore& store,
                const AreaZoomConfig& zoom);
  void stepRotate(ObjectStore& store);
  void stepScale(ObjectStore& store);

  HandState state_;
  float handArea_{0};

  // Captured when a locked mode begins.
  Vec2 grabOffset_;
  Vec3 grabOffset3d_;
  float grabArea_{0};
  float grabScale_{1};
  float lastAngleDeg_{0};
  float lastDistance_{0};
  std::uint32_t selectTicks_{0};
  ObjectId deniedTarget_{kNoObject};
};

} // namespace gt
