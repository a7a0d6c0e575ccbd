// Table client: connects to a capture server (or replays a recorded
// session), runs the interaction tick loop, and writes telemetry to stdout.
//
//   table_client [--config file.json] [--ws ws://host:port]
//                [--replay session.jsonl] [--ticks N] [--demo 2d|3d]
//                [--points] [--stdin-controls]
//
// stdout: newline-delimited JSON, one "snapshot" per tick plus an
//         "events" line whenever transitions happened.
// stdin (with --stdin-controls): control envelopes, one per line.

#include "gt/data/QueueMessageSource.hpp"
#include "gt/data/ThreadSafeQueue.hpp"
#include "gt/data/WebSocketMessageSource.hpp"
#include "gt/protocol/Messages.hpp"
#include "gt/session/SessionConfig.hpp"
#include "gt/session/SnapshotJson.hpp"
#include "gt/session/TableSession.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static std::string readLine(std::FILE* f, bool& eof) {
  std::string line;
  int c;
  while ((c = std::fgetc(f)) != EOF && c != '\n') {
    line += static_cast<char>(c);
  }
  eof = (c == EOF);
  return line;
}

static bool readLines(const std::string& path, std::vector<std::string>& out) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;
  bool eof = false;
  while (!eof) {
    std::string line = readLine(f, eof);
    if (!line.empty()) out.push_back(line);
  }
  std::fclose(f);
  return true;
}

int main(int argc, char* argv[]) {
  std::string configPath, wsUrl, replayPath, demoSet;
  long maxTicks = -1;
  bool includePoints = false;
  bool stdinControls = false;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) configPath = argv[++i];
    else if (a == "--ws" && i + 1 < argc) wsUrl = argv[++i];
    else if (a == "--replay" && i + 1 < argc) replayPath = argv[++i];
    else if (a == "--ticks" && i + 1 < argc) maxTicks = std::strtol(argv[++i], nullptr, 10);
    else if (a == "--demo" && i + 1 < argc) demoSet = argv[++i];
    else if (a == "--points") includePoints = true;
    else if (a == "--stdin-controls") stdinControls = true;
    else {
      std::fprintf(stderr, "unknown argument: %s\n", a.c_str());
      return 2;
    }
  }

  gt::SessionConfig cfg;
  if (!configPath.empty()) {
    gt::ConfigResult r = gt::loadSessionConfig(configPath, cfg);
    if (!r.ok) {
      std::fprintf(stderr, "[table_client] %s\n", r.message.c_str());
      return 1;
    }
  }
  if (!wsUrl.empty()) cfg.connection.url = wsUrl;

  // Source: replay file or live server.
  std::vector<std::string> replay;
  std::unique_ptr<gt::MessageSource> source;
  gt::QueueMessageSource* replaySource = nullptr;
  if (!replayPath.empty()) {
    if (!readLines(replayPath, replay)) {
      std::fprintf(stderr, "[table_client] cannot read %s\n", replayPath.c_str());
      return 1;
    }
    auto q = std::make_unique<gt::QueueMessageSource>(cfg.connection.maxQueueSize);
    replaySource = q.get();
    source = std::move(q);
    if (maxTicks < 0) maxTicks = static_cast<long>(replay.size());
  } else {
    source = std::make_unique<gt::WebSocketMessageSource>(cfg.connection);
  }

  gt::TableSession session(*source, cfg);
  source->start();

  if (!demoSet.empty()) {
    gt::ControlCommand cmd;
    cmd.kind = gt::ControlKind::AddDemoObjects;
    if (!gt::parseDemoSet(demoSet, cmd.demoSet)) {
      std::fprintf(stderr, "[table_client] unknown demo set '%s'\n", demoSet.c_str());
      return 2;
    }
    session.submit(cmd);
  }

  // The reader thread owns only this shared state, so it may outlive main's
  // locals while it stays blocked on stdin.
  struct StdinLines {
    gt::ThreadSafeQueue<std::string> lines{64};
    std::atomic<bool> open{true};
  };
  auto stdinLines = std::make_shared<StdinLines>();
  std::thread controlThread;
  if (stdinControls) {
    controlThread = std::thread([stdinLines] {
      bool eof = false;
      while (!eof) {
        std::string line = readLine(stdin, eof);
        if (line.empty()) continue;
        if (!stdinLines->lines.push(std::move(line))) {
          std::fprintf(stderr, "[table_client] control backlog full, oldest dropped\n");
        }
      }
      stdinLines->open.store(false);
    });
  }
  std::vector<std::string> controlLines;

  const auto period = std::chrono::microseconds(1000000 / cfg.tickHz);
  auto next = std::chrono::steady_clock::now();
  std::size_t replayPos = 0;

  for (long t = 0; maxTicks < 0 || t < maxTicks; ++t) {
    if (replaySource && replayPos < replay.size()) {
      replaySource->push(replay[replayPos++]);
    }

    controlLines.clear();
    stdinLines->lines.drain(controlLines);
    for (const std::string& line : controlLines) {
      gt::ParseResult r = session.submitJson(line);
      if (!r.ok) std::fprintf(stderr, "[table_client] %s\n", r.message.c_str());
    }

    gt::TickOutcome out = session.tick();
    std::printf("%s\n", gt::serializeSnapshot(*out.snapshot, includePoints).c_str());
    if (!out.events.empty()) {
      std::printf("%s\n", gt::serializeEvents(out.events).c_str());
    }
    std::fflush(stdout);

    next += period;
    std::this_thread::sleep_until(next);
  }

  source->stop();
  if (controlThread.joinable()) {
    if (stdinLines->open.load()) {
      // Blocked on stdin; it holds no reference to the session.
      controlThread.detach();
    } else {
      controlThread.join();
    }
  }

  const gt::SessionStats& s = session.stats();
  std::fprintf(stderr,
               "[table_client] ticks=%llu frames=%llu superseded=%llu corrupt=%llu\n",
               static_cast<unsigned long long>(s.ticks),
               static_cast<unsigned long long>(s.framesApplied),
               static_cast<unsigned long long>(s.framesSuperseded),
               static_cast<unsigned long long>(s.corruptPayloads));
  return 0;
}
