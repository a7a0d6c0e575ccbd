#include "gt/interaction/InteractionEngine.hpp"

namespace gt {

static void countEvent(InteractionStats& s, EventType t) {
  switch (t) {
    case EventType::HoverStart:
    case EventType::HoverSwitch: ++s.hovers; break;
    case EventType::DragStart:   ++s.drags; break;
    case EventType::RotateStart: ++s.rotations; break;
    case EventType::ScaleStart:  ++s.scales; break;
    case EventType::MenuOpen:    ++s.menus; break;
    case EventType::LockDenied:  ++s.lockDenials; break;
    case EventType::HandTimeout: ++s.timeouts; break;
    case EventType::TargetLost:  ++s.lostTargets; break;
    default: break;
  }
}

InteractionEngine::InteractionEngine(const InteractionConfig& cfg,
                                     std::size_t eventCapacity)
    : config_(cfg),
      hands_{{HandInteraction(HandLabel::Left), HandInteraction(HandLabel::Right)}},
      log_(eventCapacity) {}

void InteractionEngine::setDetectionTracking(bool enabled,
                                             const DetectionTrackerConfig& cfg) {
  trackDetections_ = enabled;
  tracker_.setConfig(cfg);
}

void InteractionEngine::commit(std::vector<InteractionEvent>& events) {
  for (auto& e : events) {
    e.tick = tick_;
    e.timestampMs = timestampMs_;
    e.seq = log_.append(e);
    countEvent(stats_, e.type);
  }
}

// A hand that just took a lock may have displaced another hand's
// selection; that hand drops it before anyone else runs.
void InteractionEngine::settleSelections(std::size_t after,
                                         std::vector<InteractionEvent>& events) {
  const HandState& mover = hands_[after].state();
  if (!holdsLock(mover.mode)) return;
  for (std::size_t i = 0; i < kHandCount; ++i) {
    if (i == after) continue;
    const HandState& other = hands_[i].state();
    if (other.selected == mover.selected && other.mode == HandMode::Selected) {
      hands_[i].loseSelection(store_, events);
    }
  }
}

TickResult InteractionEngine::advance(const TickInput& input) {
  ++tick_;
  timestampMs_ = input.timestampMs;
  std::vector<InteractionEvent> events;

  if (trackDetections_ && input.hasDetections) {
    tracker_.update(input.detections, tick_, store_);
  }

  std::array<const HandObservation*, kHandCount> seen{};
  for (const auto& obs : input.hands) {
    std::size_t idx = handIndex(obs.label);
    if (idx < kHandCount && !seen[idx]) seen[idx] = &obs;
  }

  for (std::size_t i = 0; i < kHandCount; ++i) {
    HandInteraction& hand = hands_[i];
    if (seen[i]) {
      Cursor cursor = mapper_ ? mapper_(*seen[i]) : mapCursor(*seen[i], config_.cursor);
      HandMode prev = hand.state().mode;
      hand.update(*seen[i], cursor, store_, config_, events);
      if ((prev == HandMode::Hover || prev == HandMode::Selecting) &&
          holdsLock(hand.state().mode)) {
        ++stats_.selections;
      }
      settleSelections(i, events);
    } else if (hand.state().present) {
      if (hand.markMissed() > config_.handTimeoutTicks) {
        hand.reset(store_, EventType::HandTimeout, events);
      }
    }
  }

  commit(events);

  TickResult result;
  result.snapshot = snapshot();
  result.events = std::move(events);
  return result;
}

std::vector<ObjectId> InteractionEngine::addDemoObjects(DemoSet set) {
  for (ObjectId id : demoIds_) store_.remove(id);
  demoIds_ = gt::addDemoObjects(store_, set);
  return demoIds_;
}

void InteractionEngine::clearObjects() {
  // Hands holding ids resolve them to idle on their next update.
  store_.clear();
  demoIds_.clear();
}

std::vector<InteractionEvent> InteractionEngine::resetAllHands(EventType reason) {
  std::vector<InteractionEvent> events;
  for (auto& hand : hands_) hand.reset(store_, reason, events);
  commit(events);
  return events;
}

std::shared_ptr<const InteractionSnapshot> InteractionEngine::snapshot() const {
  auto snap = std::make_shared<InteractionSnapshot>();
  snap->tick = tick_;
  snap->timestampMs = timestampMs_;
  snap->objects = store_.list();
  for (std::size_t i = 0; i < kHandCount; ++i) snap->hands[i] = hands_[i].state();
  snap->stats = stats_;
  return snap;
}

} // namespace gt
