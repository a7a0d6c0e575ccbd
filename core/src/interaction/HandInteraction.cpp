#include "gt/interaction/HandInteraction.hpp"

#include <algorithm>
#include <cmath>

namespace gt {

static constexpr float kRadToDeg = 180.0f / 3.14159265358979f;
static constexpr float kMinPivotDistance = 5.0f; // px

const char* handModeName(HandMode m) {
  switch (m) {
    case HandMode::Idle:      return "idle";
    case HandMode::Hover:     return "hover";
    case HandMode::Selecting: return "selecting";
    case HandMode::Selected:  return "selected";
    case HandMode::Dragging:  return "dragging";
    case HandMode::Rotating:  return "rotating";
    case HandMode::Scaling:   return "scaling";
    case HandMode::Menu:      return "menu";
  }
  return "idle";
}

static HandMode modeForIntent(Intent i) {
  switch (i) {
    case Intent::Grab:   return HandMode::Dragging;
    case Intent::Rotate: return HandMode::Rotating;
    case Intent::Scale:  return HandMode::Scaling;
    default:             return HandMode::Idle;
  }
}

static Intent intentForMode(HandMode m) {
  switch (m) {
    case HandMode::Dragging: return Intent::Grab;
    case HandMode::Rotating: return Intent::Rotate;
    case HandMode::Scaling:  return Intent::Scale;
    default:                 return Intent::Release;
  }
}

static EventType startEvent(HandMode m) {
  if (m == HandMode::Rotating) return EventType::RotateStart;
  if (m == HandMode::Scaling) return EventType::ScaleStart;
  return EventType::DragStart;
}

static EventType endEvent(HandMode m) {
  if (m == HandMode::Rotating) return EventType::RotateEnd;
  if (m == HandMode::Scaling) return EventType::ScaleEnd;
  return EventType::DragEnd;
}

static float angleAround(Vec2 center, Vec2 p) {
  return std::atan2(p.y - center.y, p.x - center.x) * kRadToDeg;
}

HandInteraction::HandInteraction(HandLabel label) {
  state_.label = label;
}

void HandInteraction::emit(EventType type, ObjectId id,
                           std::vector<InteractionEvent>& events) const {
  InteractionEvent e;
  e.type = type;
  e.hand = state_.label;
  e.objectId = id;
  e.position = state_.cursor.surface;
  events.push_back(e);
}

bool HandInteraction::resolveStale(const ObjectStore& store,
                                   std::vector<InteractionEvent>& events) {
  if (state_.selected != kNoObject && !store.get(state_.selected)) {
    ObjectId lost = state_.selected;
    state_.selected = kNoObject;
    state_.hovered = kNoObject;
    state_.mode = HandMode::Idle;
    emit(EventType::TargetLost, lost, events);
    return true;
  }
  if (state_.hovered != kNoObject && !store.get(state_.hovered)) {
    ObjectId lost = state_.hovered;
    state_.hovered = kNoObject;
    state_.mode = HandMode::Idle;
    emit(EventType::TargetLost, lost, events);
    return true;
  }
  return false;
}

void HandInteraction::update(const HandObservation& obs, const Cursor& cursor,
                             ObjectStore& store, const InteractionConfig& cfg,
                             std::vector<InteractionEvent>& events) {
  state_.present = true;
  state_.missedTicks = 0;
  state_.cursor = cursor;
  state_.gesture = obs.gesture;
  handArea_ = obs.bbox.area();
  state_.intent = normalizeGesture(obs.gesture, cfg.gestureMode, state_.intent);

  if (resolveStale(store, events)) return;

  const Intent intent = state_.intent;
  if (intent == Intent::Release) deniedTarget_ = kNoObject;
  const ObjectId hit = hitTest(cursor, store.list(), cfg.hit);

  switch (state_.mode) {
    case HandMode::Idle:
      if (intent == Intent::Menu) {
        state_.mode = HandMode::Menu;
        emit(EventType::MenuOpen, kNoObject, events);
      } else if (hit != kNoObject && intent != Intent::Grab) {
        state_.mode = HandMode::Hover;
        state_.hovered = hit;
        emit(EventType::HoverStart, hit, events);
      }
      break;

    case HandMode::Hover:
      if (intent == Intent::Menu) {
        state_.hovered = kNoObject;
        state_.mode = HandMode::Menu;
        emit(EventType::MenuOpen, kNoObject, events);
      } else if (hit == kNoObject) {
        ObjectId prev = state_.hovered;
        state_.hovered = kNoObject;
        state_.mode = HandMode::Idle;
        emit(EventType::HoverEnd, prev, events);
      } else if (hit != state_.hovered) {
        state_.hovered = hit;
        emit(EventType::HoverSwitch, hit, events);
      } else if (intent == Intent::Grab && cfg.grabConfirmTicks > 0) {
        selectTicks_ = 1;
        state_.mode = HandMode::Selecting;
        emit(EventType::SelectBegin, hit, events);
      } else if (intent != Intent::Release) {
        beginLocked(modeForIntent(intent), state_.hovered, store, events);
      }
      break;

    case HandMode::Selecting:
      if (intent != Intent::Grab || hit != state_.hovered) {
        ObjectId prev = state_.hovered;
        state_.hovered = hit;
        state_.mode = hit != kNoObject ? HandMode::Hover : HandMode::Idle;
        emit(EventType::SelectCancel, prev, events);
      } else if (++selectTicks_ > cfg.grabConfirmTicks) {
        beginLocked(HandMode::Dragging, state_.hovered, store, events);
      }
      break;

    case HandMode::Dragging:
    case HandMode::Rotating:
    case HandMode::Scaling:
      if (intent != intentForMode(state_.mode)) {
        endLocked(store, events);
      } else if (state_.mode == HandMode::Dragging) {
        stepDrag(obs, store, cfg.areaZoom);
      } else if (state_.mode == HandMode::Rotating) {
        stepRotate(store);
      } else {
        stepScale(store);
      }
      break;

    case HandMode::Selected:
      if (intent == Intent::Menu) {
        ObjectId prev = state_.selected;
        store.releaseSelection(prev, state_.label);
        state_.selected = kNoObject;
        state_.mode = HandMode::Menu;
        emit(EventType::MenuOpen, prev, events);
      } else if (intent != Intent::Release) {
        if (hit == state_.selected) {
          beginLocked(modeForIntent(intent), state_.selected, store, events);
        }
      } else if (hit != state_.selected) {
        deselect(hit, store, events);
      }
      break;

    case HandMode::Menu:
      if (intent != Intent::Menu) {
        state_.mode = HandMode::Idle;
        emit(EventType::MenuClose, kNoObject, events);
      }
      break;
  }
}

void HandInteraction::beginLocked(HandMode mode, ObjectId target, ObjectStore& store,
                                  std::vector<InteractionEvent>& events) {
  LockOutcome outcome = store.tryLock(target, state_.label);
  if (outcome == LockOutcome::Denied) {
    if (state_.mode == HandMode::Selecting) state_.mode = HandMode::Hover;
    // Reported once per attempt, not on every tick the fist is held.
    if (deniedTarget_ != target) emit(EventType::LockDenied, target, events);
    deniedTarget_ = target;
    return;
  }
  if (outcome == LockOutcome::Missing) {
    state_.hovered = kNoObject;
    state_.selected = kNoObject;
    state_.mode = HandMode::Idle;
    emit(EventType::TargetLost, target, events);
    return;
  }

  deniedTarget_ = kNoObject;
  HandLabel displaced;
  store.claimSelection(target, state_.label, displaced);
  state_.selected = target;
  state_.hovered = kNoObject;

  const InteractiveObject* obj = store.get(target);
  const Cursor& c = state_.cursor;
  grabOffset_ = obj->center() - c.surface;
  grabOffset3d_ = c.has3d ? obj->worldPosition() - c.world : Vec3{};
  grabArea_ = handArea_;
  grabScale_ = obj->scale;
  lastAngleDeg_ = angleAround(obj->center(), c.surface);
  lastDistance_ = length(c.surface - obj->center());

  state_.mode = mode;
  emit(startEvent(mode), target, events);
}

void HandInteraction::endLocked(ObjectStore& store,
                                std::vector<InteractionEvent>& events) {
  HandMode ending = state_.mode;
  store.unlock(state_.selected, state_.label);
  state_.mode = HandMode::Selected;
  emit(endEvent(ending), state_.selected, events);
}

void HandInteraction::deselect(ObjectId hit, ObjectStore& store,
                               std::vector<InteractionEvent>& events) {
  ObjectId prev = state_.selected;
  store.releaseSelection(prev, state_.label);
  state_.selected = kNoObject;
  state_.hovered = hit;
  state_.mode = hit != kNoObject ? HandMode::Hover : HandMode::Idle;
  emit(EventType::Deselect, prev, events);
}

void HandInteraction::stepDrag(const HandObservation& obs, ObjectStore& store,
                               const AreaZoomConfig& zoom) {
  const InteractiveObject* obj = store.get(state_.selected);
  if (!obj) return;
  const Cursor& c = state_.cursor;

  Vec2 delta = (c.surface + grabOffset_) - obj->center();
  store.applyOffset(state_.selected, delta);

  if (c.has3d && obj->has3d) {
    Vec3 delta3d = (c.world + grabOffset3d_) - obj->worldPosition();
    store.applyOffset3d(state_.selected, delta3d);
  }

  // Zoom is relative to the hand size and object scale at grab time.
  float area = obs.bbox.area();
  float baseline = grabArea_ > 0.0f ? grabArea_ : zoom.baselineArea;
  if (zoom.enabled && area > 0.0f && baseline > 0.0f) {
    float target = grabScale_ * std::sqrt(area / baseline);
    target = std::min(zoom.maxScale, std::max(zoom.minScale, target));
    float current = obj->scale;
    float next = current + (target - current) * zoom.smoothing;
    store.applyScale(state_.selected, next / current);
  }
}

void HandInteraction::stepRotate(ObjectStore& store) {
  const InteractiveObject* obj = store.get(state_.selected);
  if (!obj) return;
  Vec2 center = obj->center();
  if (length(state_.cursor.surface - center) < kMinPivotDistance) return;

  float angle = angleAround(center, state_.cursor.surface);
  float delta = angle - lastAngleDeg_;
  if (delta > 180.0f) delta -= 360.0f;
  if (delta < -180.0f) delta += 360.0f;
  store.applyRotation(state_.selected, delta);
  lastAngleDeg_ = angle;
}

void HandInteraction::stepScale(ObjectStore& store) {
  const InteractiveObject* obj = store.get(state_.selected);
  if (!obj) return;
  float dist = length(state_.cursor.surface - obj->center());
  if (dist >= kMinPivotDistance && lastDistance_ >= kMinPivotDistance) {
    store.applyScale(state_.selected, dist / lastDistance_);
  }
  lastDistance_ = dist;
}

void HandInteraction::reset(ObjectStore& store, EventType reason,
                            std::vector<InteractionEvent>& events) {
  store.releaseAll(state_.label);
  if (state_.mode != HandMode::Idle) {
    ObjectId ref = state_.selected != kNoObject ? state_.selected : state_.hovered;
    emit(reason, ref, events);
  }
  HandLabel label = state_.label;
  state_ = HandState{};
  state_.label = label;
  selectTicks_ = 0;
  deniedTarget_ = kNoObject;
}

void HandInteraction::loseSelection(ObjectStore& store,
                                    std::vector<InteractionEvent>& events) {
  if (state_.selected == kNoObject || holdsLock(state_.mode)) return;
  deselect(kNoObject, store, events);
}

} // namespace gt
