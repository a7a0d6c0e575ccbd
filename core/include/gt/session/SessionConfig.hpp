#pragma once
#include "gt/ErrorKind.hpp"
#include "gt/data/WebSocketMessageSource.hpp"
#include "gt/interaction/HandInteraction.hpp"
#include "gt/scene/DetectionTracker.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace gt {

struct SessionConfig {
  WebSocketSourceConfig connection;
  int tickHz{30};
  std::uint32_t pointBudget{50000};   // max points handed to the renderer
  InteractionConfig interaction;
  std::size_t eventLogCapacity{256};
  bool trackDetections{false};
  DetectionTrackerConfig detections;
};

struct ConfigResult {
  bool ok{true};
  ErrorKind error{ErrorKind::None};
  std::string message;
};

// On failure `out` is left untouched. Absent keys keep their defaults;
// present keys of the wrong type or range are rejected.
ConfigResult parseSessionConfig(const std::string& json, SessionConfig& out);
ConfigResult loadSessionConfig(const std::string& path, SessionConfig& out);

std::string serializeSessionConfig(const SessionConfig& cfg);

} // namespace gt
