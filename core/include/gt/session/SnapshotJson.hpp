#pragma once
#include "gt/events/EventLog.hpp"
#include "gt/session/TableSession.hpp"

#include <string>
#include <vector>

namespace gt {

// Telemetry encodings. Points are omitted unless includePoints; the cloud
// is summarized by its count and flags.
std::string serializeSnapshot(const SessionSnapshot& snap, bool includePoints = false);
std::string serializeInteraction(const InteractionSnapshot& snap);
std::string serializeEvents(const std::vector<InteractionEvent>& events);

} // namespace gt
