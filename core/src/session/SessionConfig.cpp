#include "gt/session/SessionConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdio>

namespace gt {

static ConfigResult bad(const std::string& message) {
  ConfigResult r;
  r.ok = false;
  r.error = ErrorKind::BadConfig;
  r.message = message;
  return r;
}

// Each reader leaves `out` alone when the key is absent and returns false
// (with err set) when it is present but unusable.

static bool readBool(const rapidjson::Value& obj, const char* key, bool& out,
                     std::string& err) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsBool()) { err = std::string(key) + ": expected bool"; return false; }
  out = it->value.GetBool();
  return true;
}

static bool readFloat(const rapidjson::Value& obj, const char* key, float& out,
                      float lo, float hi, std::string& err) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsNumber()) { err = std::string(key) + ": expected number"; return false; }
  double v = it->value.GetDouble();
  if (v < lo || v > hi) { err = std::string(key) + ": out of range"; return false; }
  out = static_cast<float>(v);
  return true;
}

static bool readUint(const rapidjson::Value& obj, const char* key, std::uint32_t& out,
                     std::uint32_t lo, std::uint32_t hi, std::string& err) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsUint()) { err = std::string(key) + ": expected unsigned integer"; return false; }
  std::uint32_t v = it->value.GetUint();
  if (v < lo || v > hi) { err = std::string(key) + ": out of range"; return false; }
  out = v;
  return true;
}

static bool readString(const rapidjson::Value& obj, const char* key, std::string& out,
                       std::string& err) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return true;
  if (!it->value.IsString()) { err = std::string(key) + ": expected string"; return false; }
  out = it->value.GetString();
  return true;
}

static const rapidjson::Value* section(const rapidjson::Value& doc, const char* key,
                                       std::string& err) {
  auto it = doc.FindMember(key);
  if (it == doc.MemberEnd()) return nullptr;
  if (!it->value.IsObject()) err = std::string(key) + ": expected object";
  return it->value.IsObject() ? &it->value : nullptr;
}

ConfigResult parseSessionConfig(const std::string& json, SessionConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    return bad(std::string("invalid JSON: ") +
               rapidjson::GetParseError_En(doc.GetParseError()));
  }
  if (!doc.IsObject()) return bad("config root must be an object");

  SessionConfig cfg = out;
  std::string err;

  if (const auto* c = section(doc, "connection", err)) {
    std::uint32_t reconnect = static_cast<std::uint32_t>(cfg.connection.reconnectIntervalMs);
    std::uint32_t queue = static_cast<std::uint32_t>(cfg.connection.maxQueueSize);
    if (!readString(*c, "url", cfg.connection.url, err) ||
        !readUint(*c, "reconnectIntervalMs", reconnect, 50, 600000, err) ||
        !readUint(*c, "maxQueueSize", queue, 1, 65536, err)) {
      return bad("connection." + err);
    }
    cfg.connection.reconnectIntervalMs = static_cast<int>(reconnect);
    cfg.connection.maxQueueSize = queue;
  }
  if (!err.empty()) return bad(err);

  if (const auto* r = section(doc, "render", err)) {
    std::uint32_t hz = static_cast<std::uint32_t>(cfg.tickHz);
    if (!readUint(*r, "pointBudget", cfg.pointBudget, 1, 10000000, err) ||
        !readUint(*r, "tickHz", hz, 1, 240, err)) {
      return bad("render." + err);
    }
    cfg.tickHz = static_cast<int>(hz);
  }
  if (!err.empty()) return bad(err);

  if (const auto* i = section(doc, "interaction", err)) {
    InteractionConfig& ic = cfg.interaction;
    std::string mode;
    std::uint32_t capacity = static_cast<std::uint32_t>(cfg.eventLogCapacity);
    if (!readString(*i, "gestureMode", mode, err) ||
        !readFloat(*i, "hoverMargin", ic.hit.hoverMargin, 0.0f, 1000.0f, err) ||
        !readUint(*i, "handTimeoutTicks", ic.handTimeoutTicks, 0, 10000, err) ||
        !readUint(*i, "grabConfirmTicks", ic.grabConfirmTicks, 0, 1000, err) ||
        !readUint(*i, "eventLogCapacity", capacity, 1, 1000000, err) ||
        !readBool(*i, "mirrorX", ic.cursor.mirrorX, err) ||
        !readFloat(*i, "frameWidth", ic.cursor.frameWidth, 1.0f, 100000.0f, err) ||
        !readFloat(*i, "frameHeight", ic.cursor.frameHeight, 1.0f, 100000.0f, err) ||
        !readBool(*i, "useDepth3d", ic.hit.use3d, err) ||
        !readFloat(*i, "hitRadius3d", ic.hit.hitRadius3d, 0.0f, 10.0f, err)) {
      return bad("interaction." + err);
    }
    if (!mode.empty() && !parseGestureMode(mode, ic.gestureMode)) {
      return bad("interaction.gestureMode: expected stable|extended");
    }
    cfg.eventLogCapacity = capacity;
  }
  if (!err.empty()) return bad(err);

  if (const auto* z = section(doc, "areaZoom", err)) {
    AreaZoomConfig& az = cfg.interaction.areaZoom;
    if (!readBool(*z, "enabled", az.enabled, err) ||
        !readFloat(*z, "baselineArea", az.baselineArea, 1.0f, 1e9f, err) ||
        !readFloat(*z, "minScale", az.minScale, 0.01f, 100.0f, err) ||
        !readFloat(*z, "maxScale", az.maxScale, 0.01f, 100.0f, err) ||
        !readFloat(*z, "smoothing", az.smoothing, 0.0f, 1.0f, err)) {
      return bad("areaZoom." + err);
    }
    if (az.minScale > az.maxScale) return bad("areaZoom: minScale > maxScale");
  }
  if (!err.empty()) return bad(err);

  if (const auto* d = section(doc, "detections", err)) {
    if (!readBool(*d, "trackDetections", cfg.trackDetections, err) ||
        !readFloat(*d, "matchDistance", cfg.detections.matchDistance, 0.0f, 100000.0f, err) ||
        !readUint(*d, "staleTicks", cfg.detections.staleTicks, 0, 1000000, err)) {
      return bad("detections." + err);
    }
  }
  if (!err.empty()) return bad(err);

  out = cfg;
  return {};
}

ConfigResult loadSessionConfig(const std::string& path, SessionConfig& out) {
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return bad("cannot open " + path);

  std::string text;
  char buf[4096];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) text.append(buf, n);
  bool readFailed = std::ferror(f) != 0;
  std::fclose(f);
  if (readFailed) return bad("read error on " + path);

  ConfigResult r = parseSessionConfig(text, out);
  if (!r.ok) r.message = path + ": " + r.message;
  return r;
}

std::string serializeSessionConfig(const SessionConfig& cfg) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  const InteractionConfig& ic = cfg.interaction;

  w.StartObject();

  w.Key("connection");
  w.StartObject();
  w.Key("url");                 w.String(cfg.connection.url.c_str());
  w.Key("reconnectIntervalMs"); w.Int(cfg.connection.reconnectIntervalMs);
  w.Key("maxQueueSize");        w.Uint64(cfg.connection.maxQueueSize);
  w.EndObject();

  w.Key("render");
  w.StartObject();
  w.Key("pointBudget"); w.Uint(cfg.pointBudget);
  w.Key("tickHz");      w.Int(cfg.tickHz);
  w.EndObject();

  w.Key("interaction");
  w.StartObject();
  w.Key("gestureMode");      w.String(gestureModeName(ic.gestureMode));
  w.Key("hoverMargin");      w.Double(ic.hit.hoverMargin);
  w.Key("handTimeoutTicks"); w.Uint(ic.handTimeoutTicks);
  w.Key("grabConfirmTicks"); w.Uint(ic.grabConfirmTicks);
  w.Key("eventLogCapacity"); w.Uint64(cfg.eventLogCapacity);
  w.Key("mirrorX");          w.Bool(ic.cursor.mirrorX);
  w.Key("frameWidth");       w.Double(ic.cursor.frameWidth);
  w.Key("frameHeight");      w.Double(ic.cursor.frameHeight);
  w.Key("useDepth3d");       w.Bool(ic.hit.use3d);
  w.Key("hitRadius3d");      w.Double(ic.hit.hitRadius3d);
  w.EndObject();

  w.Key("areaZoom");
  w.StartObject();
  w.Key("enabled");      w.Bool(ic.areaZoom.enabled);
  w.Key("baselineArea"); w.Double(ic.areaZoom.baselineArea);
  w.Key("minScale");     w.Double(ic.areaZoom.minScale);
  w.Key("maxScale");     w.Double(ic.areaZoom.maxScale);
  w.Key("smoothing");    w.Double(ic.areaZoom.smoothing);
  w.EndObject();

  w.Key("detections");
  w.StartObject();
  w.Key("trackDetections"); w.Bool(cfg.trackDetections);
  w.Key("matchDistance");   w.Double(cfg.detections.matchDistance);
  w.Key("staleTicks");      w.Uint(cfg.detections.staleTicks);
  w.EndObject();

  w.EndObject();
  return sb.GetString();
}

} // namespace gt
