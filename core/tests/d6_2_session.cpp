// D6.2 - TableSession tick loop over an in-process message source

#include "gt/cloud/Base64.hpp"
#include "gt/cloud/CloudCodec.hpp"
#include "gt/data/QueueMessageSource.hpp"
#include "gt/data/ThreadSafeQueue.hpp"
#include "gt/session/SnapshotJson.hpp"
#include "gt/session/TableSession.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <rapidjson/document.h>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static std::string encodedCloud(std::uint32_t n) {
  std::vector<gt::Vec3> pts;
  std::vector<gt::Rgb> cols;
  for (std::uint32_t i = 0; i < n; ++i) {
    float t = static_cast<float>(i);
    pts.push_back({t * 0.01f, -t * 0.02f, 1.0f + t * 0.001f});
    cols.push_back({0.5f, 0.25f, 1.0f});
  }
  gt::EncodeOptions opts;
  auto enc = gt::CloudCodec::encode(pts, cols, opts);
  requireTrue(enc.ok, "fixture encodes");
  return gt::base64Encode(enc.payload);
}

static std::string cloudFrame(std::uint64_t frameNumber, std::uint32_t n,
                              const std::string& data) {
  return "{\"type\":\"frame\",\"timestamp\":1.5,\"frame_number\":" +
         std::to_string(frameNumber) +
         ",\"pointcloud\":{\"num_points\":" + std::to_string(n) +
         ",\"compressed\":true,\"quantized\":true,\"has_colors\":true,\"data\":\"" +
         data + "\"}}";
}

static std::string handFrame(std::uint64_t frameNumber, const char* gesture, float x, float y) {
  return "{\"type\":\"frame\",\"frame_number\":" + std::to_string(frameNumber) +
         ",\"hands\":[{\"handedness\":\"Left\",\"gesture\":\"" + gesture +
         "\",\"gesture_name\":\"Gesto ✋\",\"confidence\":0.9,\"center\":{\"x\":" + std::to_string(x) +
         ",\"y\":" + std::to_string(y) + "}}]}";
}

static bool hasEvent(const gt::TickOutcome& o, gt::EventType t) {
  for (const auto& e : o.events) {
    if (e.type == t) return true;
  }
  return false;
}

int main() {
  // ---- Test 1: frame with a compressed, quantized cloud ----
  {
    gt::QueueMessageSource source;
    source.start();
    gt::SessionConfig cfg;
    gt::TableSession session(source, cfg);

    source.push(cloudFrame(10, 100, encodedCloud(100)));
    auto out = session.tick();
    requireTrue(out.frameApplied, "frame applied");
    requireTrue(out.snapshot->frameNumber == 10, "frame number");
    requireTrue(out.snapshot->cloudFresh, "fresh cloud");
    requireTrue(out.snapshot->cloud->numPoints == 100, "all points");
    requireTrue(out.snapshot->cloud->hasColors, "colors");
    requireTrue(out.snapshot->interaction->timestampMs == 1500, "timestamp ms");
    requireTrue(session.stats().pointsDecoded == 100, "decoded count");
    requireTrue(session.engine().tick() == 1, "engine advanced once");
    std::printf("  Test 1 (cloud frame): PASS\n");
  }

  // ---- Test 2: point budget ----
  {
    gt::QueueMessageSource source;
    source.start();
    gt::SessionConfig cfg;
    cfg.pointBudget = 25;
    gt::TableSession session(source, cfg);

    source.push(cloudFrame(1, 100, encodedCloud(100)));
    auto out = session.tick();
    requireTrue(out.snapshot->cloud->numPoints == 25, "reduced to budget");
    requireTrue(session.stats().pointsDecoded == 100, "decoded all");
    requireTrue(session.stats().pointsRendered == 25, "rendered budget");
    std::printf("  Test 2 (point budget): PASS\n");
  }

  // ---- Test 3: only the newest frame is applied ----
  {
    gt::QueueMessageSource source;
    source.start();
    gt::TableSession session(source, gt::SessionConfig{});

    source.push(handFrame(1, "Open_Palm", 10, 10));
    source.push(handFrame(2, "Open_Palm", 20, 20));
    source.push(handFrame(3, "Open_Palm", 30, 30));
    auto out = session.tick();
    requireTrue(out.snapshot->frameNumber == 3, "newest frame");
    requireTrue(session.stats().framesReceived == 3, "received 3");
    requireTrue(session.stats().framesSuperseded == 2, "2 superseded");
    requireTrue(session.engine().tick() == 1, "one advance");
    requireTrue(session.engine().hand(gt::HandLabel::Left).cursor.surface.x == 30.0f, "latest hand");

    out = session.tick();
    requireTrue(!out.frameApplied, "no frame, no advance");
    requireTrue(session.engine().tick() == 1, "engine idle");
    requireTrue(!out.snapshot->cloudFresh, "cloud not fresh");
    requireTrue(session.publisher().version() == 2, "snapshot still published");
    std::printf("  Test 3 (latest frame wins): PASS\n");
  }

  // ---- Test 4: corrupt payloads skip the cloud, not the session ----
  {
    gt::QueueMessageSource source;
    source.start();
    gt::TableSession session(source, gt::SessionConfig{});

    source.push(cloudFrame(1, 4, "!!not base64!!"));
    auto out = session.tick();
    requireTrue(out.frameApplied, "frame still applied");
    requireTrue(out.snapshot->cloud->numPoints == 0, "empty cloud");
    requireTrue(session.stats().corruptPayloads == 1, "counted");

    source.push(cloudFrame(2, 4, "AAECAwQFBgc="));
    out = session.tick();
    requireTrue(out.snapshot->cloud->empty(), "bad deflate gives empty cloud");
    requireTrue(session.stats().corruptPayloads == 2, "counted again");

    source.push(cloudFrame(3, 8, encodedCloud(8)));
    out = session.tick();
    requireTrue(out.snapshot->cloud->numPoints == 8, "recovers");
    std::printf("  Test 4 (corrupt payload): PASS\n");
  }

  // ---- Test 5: disconnect releases every hand ----
  {
    gt::QueueMessageSource source;
    source.start();
    gt::TableSession session(source, gt::SessionConfig{});

    requireTrue(session.submitJson(R"({"type":"add_demo_objects","mode":"2d"})").ok, "add control");
    source.push(handFrame(1, "Open_Palm", 130, 130));
    session.tick();
    requireTrue(session.engine().store().count() == 6, "demo objects added");
    requireTrue(session.engine().hand(gt::HandLabel::Left).hovered == 1, "hovering 1");

    source.push(handFrame(2, "Closed_Fist", 130, 130));
    session.tick();
    gt::HandLabel owner;
    requireTrue(session.engine().store().lockOwner(1, owner), "locked");

    source.setStatus(gt::ConnectionStatus::Disconnected);
    auto out = session.tick();
    requireTrue(out.disconnected, "disconnect seen");
    requireTrue(hasEvent(out, gt::EventType::HandReset), "hand_reset");
    requireTrue(!session.engine().store().lockOwner(1, owner), "lock released");
    requireTrue(session.engine().hand(gt::HandLabel::Left).mode == gt::HandMode::Idle, "idle");
    requireTrue(out.snapshot->connection == gt::ConnectionStatus::Disconnected, "status");

    out = session.tick();
    requireTrue(!out.disconnected, "reported once");
    requireTrue(session.stats().disconnects == 1, "one disconnect");
    std::printf("  Test 5 (disconnect): PASS\n");
  }

  // ---- Test 6: remote controls go to the source ----
  {
    gt::QueueMessageSource source;
    source.start();
    gt::TableSession session(source, gt::SessionConfig{});

    requireTrue(session.submitJson(R"({"type":"toggle_depth"})").ok, "toggle");
    requireTrue(session.submitJson(R"({"type":"set_pointcloud_downsample","factor":2})").ok, "ds");
    requireTrue(!session.submitJson(R"({"type":"set_pointcloud_downsample","factor":20})").ok, "ds range");
    session.tick();

    std::string sent;
    requireTrue(source.takeSent(sent) && sent == R"({"type":"toggle_depth"})", "toggle sent");
    requireTrue(source.takeSent(sent) && sent == R"({"type":"set_pointcloud_downsample","factor":2})", "ds sent");
    requireTrue(!source.takeSent(sent), "nothing else");
    requireTrue(session.stats().controlsSent == 2, "counted");

    source.setStatus(gt::ConnectionStatus::Connecting);
    gt::ControlCommand ping;
    ping.kind = gt::ControlKind::Ping;
    session.submit(ping);
    session.tick();
    requireTrue(!source.takeSent(sent), "not sent while disconnected");
    requireTrue(session.stats().controlsSent == 2, "not counted");
    std::printf("  Test 6 (remote controls): PASS\n");
  }

  // ---- Test 7: clear drops objects and references ----
  {
    gt::QueueMessageSource source;
    source.start();
    gt::TableSession session(source, gt::SessionConfig{});

    session.submitJson(R"({"type":"add_demo_objects"})");
    source.push(handFrame(1, "Open_Palm", 130, 130));
    session.tick();
    source.push(handFrame(2, "Closed_Fist", 130, 130));
    session.tick();

    session.submitJson(R"({"type":"clear_demo_objects"})");
    auto out = session.tick();
    requireTrue(session.engine().store().count() == 0, "cleared");
    requireTrue(hasEvent(out, gt::EventType::TargetLost), "target_lost");
    requireTrue(session.engine().hand(gt::HandLabel::Left).selected == gt::kNoObject, "no selection");
    std::string sent;
    requireTrue(!source.takeSent(sent), "local controls are not forwarded");
    std::printf("  Test 7 (clear): PASS\n");
  }

  // ---- Test 8: acknowledgements, bad messages, telemetry ----
  {
    gt::QueueMessageSource source;
    source.start();
    gt::TableSession session(source, gt::SessionConfig{});

    source.push(R"({"type":"welcome","config":{"pointcloud_downsample":3}})");
    source.push(R"({"type":"gestures_toggled","enabled":false})");
    source.push("garbage");
    source.push(R"({"type":"error","message":"camera unplugged"})");
    auto out = session.tick();
    requireTrue(session.flags().downsample == 3, "welcome flags");
    requireTrue(!session.flags().gesturesEnabled, "ack applied");
    requireTrue(session.stats().badMessages == 1, "bad counted");
    requireTrue(!out.frameApplied, "no frame");
    requireTrue(session.latest() == out.snapshot, "published");

    rapidjson::Document doc;
    doc.Parse(gt::serializeSnapshot(*out.snapshot).c_str());
    requireTrue(!doc.HasParseError(), "snapshot JSON");
    requireTrue(std::string(doc["type"].GetString()) == "snapshot", "type");
    requireTrue(doc["flags"]["downsample"].GetInt() == 3, "flags serialized");
    requireTrue(!doc["flags"]["gestures"].GetBool(), "gestures flag");
    requireTrue(doc["interaction"]["hands"].Size() == 2, "both hands");
    requireTrue(doc["session"]["badMessages"].GetUint64() == 1, "stats");
    requireTrue(!doc["pointcloud"].HasMember("positions"), "points omitted");
    std::printf("  Test 8 (acks and telemetry): PASS\n");
  }

  // ---- Test 9: control lines from a reader thread outlive the session ----
  {
    auto lines = std::make_shared<gt::ThreadSafeQueue<std::string>>(2);
    {
      gt::QueueMessageSource source;
      source.start();
      gt::TableSession session(source, gt::SessionConfig{});

      std::thread reader([lines] {
        lines->push(R"({"type":"add_demo_objects","mode":"2d"})");
      });
      reader.join();

      std::vector<std::string> pending;
      requireTrue(lines->drain(pending) == 1, "one line");
      for (const std::string& line : pending) {
        requireTrue(session.submitJson(line).ok, "line submitted");
      }
      session.tick();
      requireTrue(session.engine().store().count() == 6, "control applied");
    }

    std::thread late([lines] {
      lines->push("a");
      lines->push("b");
      lines->push("c");
    });
    late.join();
    requireTrue(lines->size() == 2 && lines->dropped() == 1, "queue still bounded");
    std::printf("  Test 9 (reader thread lines): PASS\n");
  }

  std::printf("D6.2 session: ALL PASS\n");
  return 0;
}
