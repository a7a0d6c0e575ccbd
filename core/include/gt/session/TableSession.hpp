#pragma once
#include "gt/cloud/PointCloudFrame.hpp"
#include "gt/data/MessageSource.hpp"
#include "gt/data/ThreadSafeQueue.hpp"
#include "gt/interaction/InteractionEngine.hpp"
#include "gt/protocol/Messages.hpp"
#include "gt/session/SessionConfig.hpp"
#include "gt/session/SnapshotPublisher.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace gt {

struct SessionStats {
  std::uint64_t ticks{0};
  std::uint64_t framesReceived{0};
  std::uint64_t framesSuperseded{0}; // replaced by a newer frame before use
  std::uint64_t framesApplied{0};
  std::uint64_t corruptPayloads{0};
  std::uint64_t badMessages{0};
  std::uint64_t disconnects{0};
  std::uint64_t controlsSent{0};
  std::uint64_t pointsDecoded{0};
  std::uint64_t pointsRendered{0};
  double lastDecodeMicros{0};
};

// What the renderer and telemetry see after a tick.
struct SessionSnapshot {
  std::uint64_t frameNumber{0};
  std::shared_ptr<const InteractionSnapshot> interaction;
  std::shared_ptr<const PointCloudFrame> cloud; // reduced to the point budget
  bool cloudFresh{false};                       // decoded during this tick
  RemoteFlags flags;
  ConnectionStatus connection{ConnectionStatus::Disconnected};
  SessionStats stats;
};

struct TickOutcome {
  std::shared_ptr<const SessionSnapshot> snapshot;
  std::vector<InteractionEvent> events;
  bool frameApplied{false};
  bool disconnected{false};
};

// Tick loop owner. tick() must be called from one thread; submit() and
// latest() may be called from any thread.
class TableSession {
public:
  TableSession(MessageSource& source, const SessionConfig& cfg);

  // Queued and applied at the start of the next tick.
  bool submit(const ControlCommand& cmd);
  ParseResult submitJson(const std::string& json);

  void setCursorMapper(CursorMapper mapper) { engine_.setCursorMapper(std::move(mapper)); }

  // Drains the source, keeps only the newest frame, and advances the
  // engine once if a frame arrived. Always publishes a snapshot.
  TickOutcome tick();

  std::shared_ptr<const SessionSnapshot> latest() const { return publisher_.latest(); }
  const SnapshotPublisher<SessionSnapshot>& publisher() const { return publisher_; }

  InteractionEngine& engine() { return engine_; }
  const InteractionEngine& engine() const { return engine_; }
  const RemoteFlags& flags() const { return flags_; }
  const SessionStats& stats() const { return stats_; }
  const SessionConfig& config() const { return config_; }

private:
  void applyControls(std::vector<InteractionEvent>& events);
  bool drainSource(InboundMessage& latestFrame);
  std::shared_ptr<const PointCloudFrame> decodeCloud(const PointCloudEnvelope& env);

  MessageSource& source_;
  SessionConfig config_;
  InteractionEngine engine_;
  ThreadSafeQueue<ControlCommand> controls_;
  SnapshotPublisher<SessionSnapshot> publisher_;

  RemoteFlags flags_;
  SessionStats stats_;
  ConnectionStatus lastStatus_{ConnectionStatus::Disconnected};
  std::uint64_t frameNumber_{0};
  std::shared_ptr<const PointCloudFrame> cloud_;
};

} // namespace gt
