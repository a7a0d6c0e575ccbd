// D7.1 - Session configuration

#include "gt/session/SessionConfig.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: defaults ----
  {
    gt::SessionConfig cfg;
    requireTrue(cfg.connection.url == "ws://localhost:8765", "default url");
    requireTrue(cfg.connection.reconnectIntervalMs == 3000, "reconnect 3s");
    requireTrue(cfg.pointBudget == 50000, "budget");
    requireTrue(cfg.interaction.hit.hoverMargin == 30.0f, "margin");
    requireTrue(cfg.interaction.handTimeoutTicks == 3, "timeout");
    requireTrue(cfg.interaction.gestureMode == gt::GestureMode::Stable, "stable");
    requireTrue(gt::parseSessionConfig("{}", cfg).ok, "empty object ok");
    requireTrue(cfg.pointBudget == 50000, "unchanged");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // ---- Test 2: overrides ----
  {
    gt::SessionConfig cfg;
    auto r = gt::parseSessionConfig(R"({
      "connection": {"url": "ws://table.local:9000", "reconnectIntervalMs": 500},
      "render": {"pointBudget": 20000, "tickHz": 60},
      "interaction": {"gestureMode": "extended", "hoverMargin": 12.5,
                      "handTimeoutTicks": 5, "mirrorX": true, "useDepth3d": true},
      "areaZoom": {"enabled": false},
      "detections": {"trackDetections": true, "staleTicks": 10}
    })", cfg);
    requireTrue(r.ok, "parses");
    requireTrue(cfg.connection.url == "ws://table.local:9000", "url");
    requireTrue(cfg.connection.reconnectIntervalMs == 500, "reconnect");
    requireTrue(cfg.connection.maxQueueSize == 64, "untouched key");
    requireTrue(cfg.pointBudget == 20000 && cfg.tickHz == 60, "render");
    requireTrue(cfg.interaction.gestureMode == gt::GestureMode::Extended, "mode");
    requireTrue(cfg.interaction.hit.hoverMargin == 12.5f, "margin");
    requireTrue(cfg.interaction.handTimeoutTicks == 5, "timeout");
    requireTrue(cfg.interaction.cursor.mirrorX && cfg.interaction.hit.use3d, "bools");
    requireTrue(!cfg.interaction.areaZoom.enabled, "zoom off");
    requireTrue(cfg.trackDetections && cfg.detections.staleTicks == 10, "detections");
    std::printf("  Test 2 (overrides): PASS\n");
  }

  // ---- Test 3: rejected input leaves the config untouched ----
  {
    gt::SessionConfig cfg;
    cfg.pointBudget = 1234;

    auto r = gt::parseSessionConfig(R"({"render": {"pointBudget": 99}, "interaction": {"hoverMargin": -1}})", cfg);
    requireTrue(!r.ok && r.error == gt::ErrorKind::BadConfig, "range rejected");
    requireTrue(r.message == "interaction.hoverMargin: out of range", "message names key");
    requireTrue(cfg.pointBudget == 1234, "earlier section not applied");

    requireTrue(!gt::parseSessionConfig(R"({"render": {"tickHz": "fast"}})", cfg).ok, "type rejected");
    requireTrue(!gt::parseSessionConfig(R"({"render": 5})", cfg).ok, "section type");
    requireTrue(!gt::parseSessionConfig(R"({"interaction": {"gestureMode": "wild"}})", cfg).ok, "mode");
    requireTrue(!gt::parseSessionConfig(R"({"areaZoom": {"minScale": 3, "maxScale": 2}})", cfg).ok, "min > max");
    requireTrue(!gt::parseSessionConfig("{oops", cfg).ok, "bad json");
    requireTrue(!gt::parseSessionConfig("[]", cfg).ok, "not an object");
    requireTrue(cfg.pointBudget == 1234 && cfg.tickHz == 30, "still untouched");
    std::printf("  Test 3 (validation): PASS\n");
  }

  // ---- Test 4: serialized config parses back ----
  {
    gt::SessionConfig cfg;
    cfg.connection.url = "ws://10.0.0.2:8765";
    cfg.pointBudget = 7777;
    cfg.interaction.gestureMode = gt::GestureMode::Extended;
    cfg.interaction.grabConfirmTicks = 4;
    cfg.interaction.areaZoom.smoothing = 0.5f;
    cfg.eventLogCapacity = 64;

    gt::SessionConfig back;
    auto r = gt::parseSessionConfig(gt::serializeSessionConfig(cfg), back);
    requireTrue(r.ok, "parses back");
    requireTrue(back.connection.url == cfg.connection.url, "url");
    requireTrue(back.pointBudget == 7777, "budget");
    requireTrue(back.interaction.gestureMode == gt::GestureMode::Extended, "mode");
    requireTrue(back.interaction.grabConfirmTicks == 4, "confirm");
    requireTrue(back.interaction.areaZoom.smoothing == 0.5f, "smoothing");
    requireTrue(back.eventLogCapacity == 64, "capacity");
    std::printf("  Test 4 (serialize): PASS\n");
  }

  // ---- Test 5: missing file ----
  {
    gt::SessionConfig cfg;
    auto r = gt::loadSessionConfig("/nonexistent/grasp_table.json", cfg);
    requireTrue(!r.ok && r.error == gt::ErrorKind::BadConfig, "missing file");
    requireTrue(r.message.find("cannot open") == 0, "message");
    std::printf("  Test 5 (load): PASS\n");
  }

  std::printf("D7.1 config: ALL PASS\n");
  return 0;
}
