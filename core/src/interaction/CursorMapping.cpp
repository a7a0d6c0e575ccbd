#include "gt/interaction/HandObservation.hpp"

namespace gt {

Cursor mapCursor(const HandObservation& obs, const CursorMappingConfig& cfg) {
  Cursor c;
  c.surface = obs.center;
  if (cfg.mirrorX) c.surface.x = cfg.frameWidth - obs.center.x;
  c.has3d = obs.has3d;
  c.world = obs.position3d;
  return c;
}

} // namespace gt
