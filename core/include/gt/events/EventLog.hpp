#pragma once
#include "gt/ids/Id.hpp"
#include "gt/interaction/HandLabel.hpp"
#include "gt/math/Vec.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace gt {

enum class EventType : std::uint8_t {
  HoverStart = 0,
  HoverSwitch,
  HoverEnd,
  SelectBegin,   // grab confirmation started
  SelectCancel,
  DragStart,
  DragEnd,
  RotateStart,
  RotateEnd,
  ScaleStart,
  ScaleEnd,
  Deselect,
  MenuOpen,
  MenuClose,
  LockDenied,
  TargetLost,    // held or hovered object disappeared from the store
  HandTimeout,
  HandReset      // source disconnected
};

const char* eventTypeName(EventType t);

struct InteractionEvent {
  std::uint64_t seq{0}; // assigned by the log, 1-based
  EventType type{EventType::HoverStart};
  HandLabel hand{HandLabel::Left};
  ObjectId objectId{kNoObject};
  std::uint64_t tick{0};
  std::int64_t timestampMs{0};
  Vec2 position;
};

// Bounded ring of the most recent events. Appending past capacity
// overwrites the oldest entry.
class EventLog {
public:
  explicit EventLog(std::size_t capacity = 256);

  // Assigns the next sequence number and returns it.
  std::uint64_t append(InteractionEvent e);
  void clear();

  // Oldest first.
  std::vector<InteractionEvent> recent() const;
  // Retained events with seq > afterSeq, oldest first.
  std::vector<InteractionEvent> since(std::uint64_t afterSeq) const;

  std::size_t size() const { return size_; }
  std::size_t capacity() const { return ring_.size(); }
  std::uint64_t lastSeq() const { return nextSeq_ - 1; }
  std::uint64_t dropped() const { return dropped_; }

  // {"events":[...],"dropped":N}
  std::string toJSON() const;
  static void writeEvent(rapidjson::Writer<rapidjson::StringBuffer>& w,
                         const InteractionEvent& e);

private:
  std::vector<InteractionEvent> ring_;
  std::size_t head_{0}; // next write slot
  std::size_t size_{0};
  std::uint64_t nextSeq_{1};
  std::uint64_t dropped_{0};
};

} // namespace gt
