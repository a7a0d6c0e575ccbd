#include "gt/session/TableSession.hpp"

#include "gt/cloud/Base64.hpp"
#include "gt/cloud/CloudCodec.hpp"
#include "gt/cloud/LodReducer.hpp"

#include <chrono>
#include <cstdio>

namespace gt {

TableSession::TableSession(MessageSource& source, const SessionConfig& cfg)
    : source_(source),
      config_(cfg),
      engine_(cfg.interaction, cfg.eventLogCapacity),
      controls_(cfg.connection.maxQueueSize),
      cloud_(std::make_shared<PointCloudFrame>()) {
  engine_.setDetectionTracking(cfg.trackDetections, cfg.detections);
}

bool TableSession::submit(const ControlCommand& cmd) {
  if (!controls_.push(cmd)) {
    std::fprintf(stderr, "[TableSession] control queue full, dropped oldest\n");
  }
  return true;
}

ParseResult TableSession::submitJson(const std::string& json) {
  ControlCommand cmd;
  ParseResult r = parseControl(json, cmd);
  if (r.ok) submit(cmd);
  return r;
}

void TableSession::applyControls(std::vector<InteractionEvent>& events) {
  std::vector<ControlCommand> pending;
  controls_.drain(pending);
  for (const ControlCommand& cmd : pending) {
    if (cmd.kind == ControlKind::AddDemoObjects) {
      engine_.addDemoObjects(cmd.demoSet);
      continue;
    }
    if (cmd.kind == ControlKind::ClearDemoObjects) {
      engine_.clearObjects();
      // Drop dangling references now rather than on the hands' next frame.
      for (const auto& e : engine_.resetAllHands(EventType::TargetLost)) {
        events.push_back(e);
      }
      continue;
    }

    std::string text, err;
    if (!buildControl(cmd, text, err)) {
      std::fprintf(stderr, "[TableSession] control rejected: %s\n", err.c_str());
      continue;
    }
    if (!source_.send(text)) {
      std::fprintf(stderr, "[TableSession] not connected, dropped control %s\n",
                   text.c_str());
      continue;
    }
    ++stats_.controlsSent;
  }
}

bool TableSession::drainSource(InboundMessage& latestFrame) {
  bool haveFrame = false;
  std::string text;
  while (source_.poll(text)) {
    InboundMessage msg;
    ParseResult r = parseMessage(text, msg);
    if (!r.ok) {
      ++stats_.badMessages;
      std::fprintf(stderr, "[TableSession] bad message: %s\n", r.message.c_str());
      continue;
    }

    switch (msg.type) {
      case MessageType::Frame:
        ++stats_.framesReceived;
        if (haveFrame) ++stats_.framesSuperseded;
        latestFrame = std::move(msg);
        haveFrame = true;
        break;
      case MessageType::Error:
        std::fprintf(stderr, "[TableSession] server error: %s\n", msg.text.c_str());
        break;
      case MessageType::Unknown:
        break;
      default:
        applyRemoteFlags(msg, flags_);
        break;
    }
  }
  return haveFrame;
}

std::shared_ptr<const PointCloudFrame> TableSession::decodeCloud(
    const PointCloudEnvelope& env) {
  auto t0 = std::chrono::steady_clock::now();

  std::vector<std::uint8_t> payload;
  if (!base64Decode(env.data, payload)) {
    ++stats_.corruptPayloads;
    std::fprintf(stderr, "[TableSession] point cloud: invalid base64, frame skipped\n");
    return std::make_shared<PointCloudFrame>();
  }

  DecodeMeta meta;
  meta.quantized = env.quantized;
  meta.compressed = env.compressed;
  meta.numPointsHint = env.numPoints;

  DecodeResult decoded = CloudCodec::decode(payload, meta);
  if (!decoded.ok) {
    ++stats_.corruptPayloads;
    std::fprintf(stderr, "[TableSession] point cloud: %s, frame skipped\n",
                 decoded.message.c_str());
    return std::make_shared<PointCloudFrame>();
  }
  if (env.numPoints != 0 && env.numPoints != decoded.frame.numPoints) {
    std::fprintf(stderr, "[TableSession] point cloud: envelope says %u points, body has %u\n",
                 env.numPoints, decoded.frame.numPoints);
  }

  stats_.pointsDecoded += decoded.frame.numPoints;
  auto reduced = std::make_shared<PointCloudFrame>(
      reduceToBudget(decoded.frame, config_.pointBudget));
  stats_.pointsRendered += reduced->numPoints;
  stats_.lastDecodeMicros = std::chrono::duration<double, std::micro>(
      std::chrono::steady_clock::now() - t0).count();
  return reduced;
}

TickOutcome TableSession::tick() {
  TickOutcome outcome;
  ++stats_.ticks;

  ConnectionStatus status = source_.status();
  if (lastStatus_ == ConnectionStatus::Connected && status != ConnectionStatus::Connected) {
    ++stats_.disconnects;
    outcome.disconnected = true;
    std::fprintf(stderr, "[TableSession] source %s, releasing all hands\n",
                 connectionStatusName(status));
    outcome.events = engine_.resetAllHands(EventType::HandReset);
  }
  lastStatus_ = status;

  applyControls(outcome.events);

  InboundMessage frameMsg;
  bool haveFrame = drainSource(frameMsg);
  bool cloudFresh = false;

  if (haveFrame) {
    const FrameMessage& frame = frameMsg.frame;
    frameNumber_ = frame.frameNumber;

    if (frame.pointcloud.present) {
      cloud_ = decodeCloud(frame.pointcloud);
      cloudFresh = true;
    }

    TickInput input;
    input.timestampMs = frame.timestampMs;
    input.hands = frame.hands;
    input.hasDetections = frame.hasObjects;
    input.detections = frame.objects;

    TickResult r = engine_.advance(input);
    for (auto& e : r.events) outcome.events.push_back(e);
    ++stats_.framesApplied;
    outcome.frameApplied = true;
  }

  auto snap = std::make_shared<SessionSnapshot>();
  snap->frameNumber = frameNumber_;
  snap->interaction = engine_.snapshot();
  snap->cloud = cloud_;
  snap->cloudFresh = cloudFresh;
  snap->flags = flags_;
  snap->connection = status;
  snap->stats = stats_;
  publisher_.publish(snap);

  outcome.snapshot = snap;
  return outcome;
}

} // namespace gt
