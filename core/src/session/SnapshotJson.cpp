#include "gt/session/SnapshotJson.hpp"

#include "gt/scene/ObjectStore.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace gt {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

static void writeHand(JsonWriter& w, const HandState& h) {
  w.StartObject();
  w.Key("hand");    w.String(handLabelName(h.label));
  w.Key("present"); w.Bool(h.present);
  w.Key("state");   w.String(handModeName(h.mode));
  w.Key("gesture"); w.String(gestureName(h.gesture));
  w.Key("intent");  w.String(intentName(h.intent));
  w.Key("position");
  w.StartArray();
  w.Double(h.cursor.surface.x); w.Double(h.cursor.surface.y);
  if (h.cursor.has3d) w.Double(h.cursor.world.z);
  w.EndArray();
  w.Key("hovered");
  if (h.hovered != kNoObject) w.Uint(h.hovered); else w.Null();
  w.Key("selected");
  if (h.selected != kNoObject) w.Uint(h.selected); else w.Null();
  w.EndObject();
}

static void writeStats(JsonWriter& w, const InteractionStats& s) {
  w.StartObject();
  w.Key("hovers");      w.Uint64(s.hovers);
  w.Key("selections");  w.Uint64(s.selections);
  w.Key("drags");       w.Uint64(s.drags);
  w.Key("rotations");   w.Uint64(s.rotations);
  w.Key("scales");      w.Uint64(s.scales);
  w.Key("menus");       w.Uint64(s.menus);
  w.Key("lockDenials"); w.Uint64(s.lockDenials);
  w.Key("timeouts");    w.Uint64(s.timeouts);
  w.Key("lostTargets"); w.Uint64(s.lostTargets);
  w.EndObject();
}

static void writeInteraction(JsonWriter& w, const InteractionSnapshot& s) {
  w.StartObject();
  w.Key("tick");      w.Uint64(s.tick);
  w.Key("timestamp"); w.Int64(s.timestampMs);
  w.Key("objects");
  w.StartArray();
  for (const auto& o : s.objects) ObjectStore::writeObject(w, o);
  w.EndArray();
  w.Key("hands");
  w.StartArray();
  for (const auto& h : s.hands) writeHand(w, h);
  w.EndArray();
  w.Key("stats");
  writeStats(w, s.stats);
  w.EndObject();
}

static void writeCloud(JsonWriter& w, const PointCloudFrame& f, bool fresh,
                       bool includePoints) {
  w.StartObject();
  w.Key("numPoints"); w.Uint(f.numPoints);
  w.Key("hasColors"); w.Bool(f.hasColors);
  w.Key("quantized"); w.Bool(f.quantized);
  w.Key("fresh");     w.Bool(fresh);
  if (includePoints) {
    w.Key("positions");
    w.StartArray();
    for (const auto& p : f.positions) { w.Double(p.x); w.Double(p.y); w.Double(p.z); }
    w.EndArray();
    if (f.hasColors) {
      w.Key("colors");
      w.StartArray();
      for (const auto& c : f.colors) { w.Double(c.r); w.Double(c.g); w.Double(c.b); }
      w.EndArray();
    }
  }
  w.EndObject();
}

std::string serializeInteraction(const InteractionSnapshot& snap) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  writeInteraction(w, snap);
  return sb.GetString();
}

std::string serializeSnapshot(const SessionSnapshot& snap, bool includePoints) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  w.StartObject();
  w.Key("type");        w.String("snapshot");
  w.Key("frameNumber"); w.Uint64(snap.frameNumber);
  w.Key("connection");  w.String(connectionStatusName(snap.connection));

  w.Key("interaction");
  if (snap.interaction) writeInteraction(w, *snap.interaction); else w.Null();

  w.Key("pointcloud");
  if (snap.cloud) writeCloud(w, *snap.cloud, snap.cloudFresh, includePoints); else w.Null();

  const RemoteFlags& f = snap.flags;
  w.Key("flags");
  w.StartObject();
  w.Key("depth");      w.Bool(f.depthEnabled);
  w.Key("objects");    w.Bool(f.objectsEnabled);
  w.Key("gestures");   w.Bool(f.gesturesEnabled);
  w.Key("pointcloud"); w.Bool(f.pointcloudEnabled);
  w.Key("colorMode");  w.String(colorModeName(f.colorMode));
  w.Key("downsample"); w.Int(f.downsample);
  w.EndObject();

  const SessionStats& s = snap.stats;
  w.Key("session");
  w.StartObject();
  w.Key("ticks");            w.Uint64(s.ticks);
  w.Key("framesReceived");   w.Uint64(s.framesReceived);
  w.Key("framesSuperseded"); w.Uint64(s.framesSuperseded);
  w.Key("framesApplied");    w.Uint64(s.framesApplied);
  w.Key("corruptPayloads");  w.Uint64(s.corruptPayloads);
  w.Key("badMessages");      w.Uint64(s.badMessages);
  w.Key("disconnects");      w.Uint64(s.disconnects);
  w.Key("decodeMicros");     w.Double(s.lastDecodeMicros);
  w.EndObject();

  w.EndObject();
  return sb.GetString();
}

std::string serializeEvents(const std::vector<InteractionEvent>& events) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("type"); w.String("events");
  w.Key("events");
  w.StartArray();
  for (const auto& e : events) EventLog::writeEvent(w, e);
  w.EndArray();
  w.EndObject();
  return sb.GetString();
}

} // namespace gt
