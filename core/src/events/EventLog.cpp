#include "gt/events/EventLog.hpp"

namespace gt {

const char* eventTypeName(EventType t) {
  switch (t) {
    case EventType::HoverStart:   return "hover_start";
    case EventType::HoverSwitch:  return "hover_switch";
    case EventType::HoverEnd:     return "hover_end";
    case EventType::SelectBegin:  return "select_begin";
    case EventType::SelectCancel: return "select_cancel";
    case EventType::DragStart:    return "drag_start";
    case EventType::DragEnd:      return "drag_end";
    case EventType::RotateStart:  return "rotate_start";
    case EventType::RotateEnd:    return "rotate_end";
    case EventType::ScaleStart:   return "scale_start";
    case EventType::ScaleEnd:     return "scale_end";
    case EventType::Deselect:     return "deselect";
    case EventType::MenuOpen:     return "menu_open";
    case EventType::MenuClose:    return "menu_close";
    case EventType::LockDenied:   return "lock_denied";
    case EventType::TargetLost:   return "target_lost";
    case EventType::HandTimeout:  return "hand_timeout";
    case EventType::HandReset:    return "hand_reset";
  }
  return "unknown";
}

EventLog::EventLog(std::size_t capacity)
    : ring_(capacity > 0 ? capacity : 1) {}

std::uint64_t EventLog::append(InteractionEvent e) {
  e.seq = nextSeq_++;
  if (size_ == ring_.size()) {
    ++dropped_;
  } else {
    ++size_;
  }
  ring_[head_] = e;
  head_ = (head_ + 1) % ring_.size();
  return e.seq;
}

void EventLog::clear() {
  head_ = 0;
  size_ = 0;
}

std::vector<InteractionEvent> EventLog::recent() const {
  std::vector<InteractionEvent> out;
  out.reserve(size_);
  std::size_t start = (head_ + ring_.size() - size_) % ring_.size();
  for (std::size_t i = 0; i < size_; ++i) {
    out.push_back(ring_[(start + i) % ring_.size()]);
  }
  return out;
}

std::vector<InteractionEvent> EventLog::since(std::uint64_t afterSeq) const {
  std::vector<InteractionEvent> out;
  std::size_t start = (head_ + ring_.size() - size_) % ring_.size();
  for (std::size_t i = 0; i < size_; ++i) {
    const auto& e = ring_[(start + i) % ring_.size()];
    if (e.seq > afterSeq) out.push_back(e);
  }
  return out;
}

void EventLog::writeEvent(rapidjson::Writer<rapidjson::StringBuffer>& w,
                          const InteractionEvent& e) {
  w.StartObject();
  w.Key("seq");  w.Uint64(e.seq);
  w.Key("type"); w.String(eventTypeName(e.type));
  w.Key("hand"); w.String(handLabelName(e.hand));
  w.Key("objectId");
  if (e.objectId != kNoObject) w.Uint(e.objectId); else w.Null();
  w.Key("tick");      w.Uint64(e.tick);
  w.Key("timestamp"); w.Int64(e.timestampMs);
  w.Key("position");
  w.StartArray();
  w.Double(e.position.x); w.Double(e.position.y);
  w.EndArray();
  w.EndObject();
}

std::string EventLog::toJSON() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("events");
  w.StartArray();
  for (const auto& e : recent()) writeEvent(w, e);
  w.EndArray();
  w.Key("dropped"); w.Uint64(dropped_);
  w.EndObject();

  return sb.GetString();
}

} // namespace gt
