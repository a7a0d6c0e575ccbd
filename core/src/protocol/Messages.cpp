#include "gt/protocol/Messages.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>

namespace gt {

// ---- helpers ----

static ParseResult fail(const std::string& message) {
  ParseResult r;
  r.ok = false;
  r.error = ErrorKind::BadMessage;
  r.message = message;
  return r;
}

static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsString()) return {};
  return v->GetString();
}

static double getNumberOr(const rapidjson::Value& obj, const char* key, double fallback) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return fallback;
  return v->GetDouble();
}

static bool getBoolOr(const rapidjson::Value& obj, const char* key, bool fallback) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsBool()) return fallback;
  return v->GetBool();
}

static Rect readRect(const rapidjson::Value& v) {
  Rect r;
  r.x = static_cast<float>(getNumberOr(v, "x", 0));
  r.y = static_cast<float>(getNumberOr(v, "y", 0));
  r.width = static_cast<float>(getNumberOr(v, "width", 0));
  r.height = static_cast<float>(getNumberOr(v, "height", 0));
  return r;
}

static bool readVec3(const rapidjson::Value& v, Vec3& out) {
  if (v.IsArray() && v.Size() == 3 && v[0].IsNumber() && v[1].IsNumber() &&
      v[2].IsNumber()) {
    out = {static_cast<float>(v[0].GetDouble()), static_cast<float>(v[1].GetDouble()),
           static_cast<float>(v[2].GetDouble())};
    return true;
  }
  if (v.IsObject() && getMember(v, "x") && getMember(v, "y") && getMember(v, "z")) {
    out = {static_cast<float>(getNumberOr(v, "x", 0)),
           static_cast<float>(getNumberOr(v, "y", 0)),
           static_cast<float>(getNumberOr(v, "z", 0))};
    return true;
  }
  return false;
}

// Center falls back to the bbox center when absent.
static Vec2 readCenter(const rapidjson::Value& obj, const Rect& bbox) {
  const auto* c = getMember(obj, "center");
  if (c && c->IsObject()) {
    return {static_cast<float>(getNumberOr(*c, "x", 0)),
            static_cast<float>(getNumberOr(*c, "y", 0))};
  }
  return bbox.center();
}

const char* colorModeName(ColorMode m) {
  switch (m) {
    case ColorMode::Rgb:    return "rgb";
    case ColorMode::Depth:  return "depth";
    case ColorMode::Height: return "height";
    case ColorMode::None:   return "none";
  }
  return "rgb";
}

bool parseColorMode(const std::string& s, ColorMode& out) {
  if (s == "rgb")    { out = ColorMode::Rgb;    return true; }
  if (s == "depth")  { out = ColorMode::Depth;  return true; }
  if (s == "height") { out = ColorMode::Height; return true; }
  if (s == "none")   { out = ColorMode::None;   return true; }
  return false;
}

// ---- frame ----

static bool parseHand(const rapidjson::Value& v, HandObservation& out) {
  if (!v.IsObject()) return false;
  if (!parseHandLabel(getStringOrEmpty(v, "handedness"), out.label)) return false;

  // "gesture" carries the recognizer symbol; "gesture_name" is a display label.
  std::string gesture = getStringOrEmpty(v, "gesture");
  if (gesture.empty()) gesture = getStringOrEmpty(v, "gesture_name");
  out.gesture = parseGesture(gesture);
  out.confidence = static_cast<float>(getNumberOr(v, "confidence", 0));

  if (const auto* b = getMember(v, "bbox")) {
    if (b->IsObject()) out.bbox = readRect(*b);
  }
  out.center = readCenter(v, out.bbox);

  if (const auto* p = getMember(v, "position_3d")) {
    out.has3d = readVec3(*p, out.position3d);
  }
  return true;
}

static void parseDetection(const rapidjson::Value& v, Detection& out) {
  const auto* id = getMember(v, "class_id");
  if (id && id->IsInt()) out.classId = id->GetInt();
  out.className = getStringOrEmpty(v, "class_name");
  out.confidence = static_cast<float>(getNumberOr(v, "confidence", 0));
  if (const auto* b = getMember(v, "bbox")) {
    if (b->IsObject()) out.bbox = readRect(*b);
  }
  out.center = readCenter(v, out.bbox);
}

static ParseResult parseFrame(const rapidjson::Value& doc, FrameMessage& out) {
  // Server timestamps are seconds since the epoch.
  double ts = getNumberOr(doc, "timestamp", 0);
  out.timestampMs = static_cast<std::int64_t>(std::llround(ts * 1000.0));

  const auto* fn = getMember(doc, "frame_number");
  if (fn && fn->IsUint64()) out.frameNumber = fn->GetUint64();

  if (const auto* objs = getMember(doc, "objects")) {
    if (!objs->IsArray()) return fail("frame: objects is not an array");
    out.hasObjects = true;
    for (const auto& v : objs->GetArray()) {
      if (!v.IsObject()) continue;
      Detection d;
      parseDetection(v, d);
      out.objects.push_back(d);
    }
  }

  if (const auto* hands = getMember(doc, "hands")) {
    if (!hands->IsArray()) return fail("frame: hands is not an array");
    for (const auto& v : hands->GetArray()) {
      HandObservation h;
      // Entries without a usable handedness cannot be keyed; skip them.
      if (parseHand(v, h)) out.hands.push_back(h);
    }
  }

  const auto* pc = getMember(doc, "pointcloud");
  if (pc && pc->IsObject()) {
    PointCloudEnvelope& env = out.pointcloud;
    env.present = true;
    const auto* n = getMember(*pc, "num_points");
    if (n && n->IsUint()) env.numPoints = n->GetUint();
    env.compressed = getBoolOr(*pc, "compressed", false);
    env.quantized = getBoolOr(*pc, "quantized", false);
    env.hasColors = getBoolOr(*pc, "has_colors", false);
    env.data = getStringOrEmpty(*pc, "data");
  }
  return {};
}

// ---- inbound ----

static void parseWelcomeConfig(const rapidjson::Value& cfg, RemoteFlags& f) {
  f.depthEnabled = getBoolOr(cfg, "depth_enabled", f.depthEnabled);
  f.objectsEnabled = getBoolOr(cfg, "objects_enabled", f.objectsEnabled);
  f.gesturesEnabled = getBoolOr(cfg, "gestures_enabled", f.gesturesEnabled);
  f.pointcloudEnabled = getBoolOr(cfg, "pointcloud_enabled", f.pointcloudEnabled);
  ColorMode mode;
  if (parseColorMode(getStringOrEmpty(cfg, "pointcloud_color_mode"), mode)) {
    f.colorMode = mode;
  }
  const auto* ds = getMember(cfg, "pointcloud_downsample");
  if (ds && ds->IsInt()) f.downsample = ds->GetInt();
}

ParseResult parseMessage(const std::string& json, InboundMessage& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    return fail(std::string("invalid JSON: ") +
                rapidjson::GetParseError_En(doc.GetParseError()));
  }
  if (!doc.IsObject()) return fail("message is not an object");

  out = InboundMessage{};
  out.typeName = getStringOrEmpty(doc, "type");
  if (out.typeName.empty()) return fail("missing string field: type");

  const std::string& t = out.typeName;
  if (t == "frame") {
    out.type = MessageType::Frame;
    return parseFrame(doc, out.frame);
  }
  if (t == "welcome") {
    out.type = MessageType::Welcome;
    out.text = getStringOrEmpty(doc, "message");
    if (const auto* cfg = getMember(doc, "config")) {
      if (cfg->IsObject()) parseWelcomeConfig(*cfg, out.flags);
    }
    return {};
  }
  if (t == "pointcloud_toggled" || t == "depth_toggled" ||
      t == "objects_toggled" || t == "gestures_toggled") {
    const auto* en = getMember(doc, "enabled");
    if (!en || !en->IsBool()) return fail(t + ": missing bool field: enabled");
    out.enabled = en->GetBool();
    if (t == "pointcloud_toggled")   out.type = MessageType::PointcloudToggled;
    else if (t == "depth_toggled")   out.type = MessageType::DepthToggled;
    else if (t == "objects_toggled") out.type = MessageType::ObjectsToggled;
    else                             out.type = MessageType::GesturesToggled;
    return {};
  }
  if (t == "pointcloud_color_mode_changed") {
    out.type = MessageType::ColorModeChanged;
    if (!parseColorMode(getStringOrEmpty(doc, "mode"), out.colorMode)) {
      return fail(t + ": unknown mode");
    }
    return {};
  }
  if (t == "pointcloud_downsample_changed") {
    out.type = MessageType::DownsampleChanged;
    const auto* f = getMember(doc, "factor");
    if (!f || !f->IsInt()) return fail(t + ": missing int field: factor");
    out.downsample = f->GetInt();
    return {};
  }
  if (t == "pong") {
    out.type = MessageType::Pong;
    return {};
  }
  if (t == "error") {
    out.type = MessageType::Error;
    out.text = getStringOrEmpty(doc, "message");
    return {};
  }

  out.type = MessageType::Unknown;
  return {};
}

bool applyRemoteFlags(const InboundMessage& msg, RemoteFlags& flags) {
  switch (msg.type) {
    case MessageType::Welcome:           flags = msg.flags; return true;
    case MessageType::PointcloudToggled: flags.pointcloudEnabled = msg.enabled; return true;
    case MessageType::DepthToggled:      flags.depthEnabled = msg.enabled; return true;
    case MessageType::ObjectsToggled:    flags.objectsEnabled = msg.enabled; return true;
    case MessageType::GesturesToggled:   flags.gesturesEnabled = msg.enabled; return true;
    case MessageType::ColorModeChanged:  flags.colorMode = msg.colorMode; return true;
    case MessageType::DownsampleChanged: flags.downsample = msg.downsample; return true;
    default: return false;
  }
}

// ---- control ----

struct ControlName {
  ControlKind kind;
  const char* name;
};

static const ControlName kControlNames[] = {
  {ControlKind::AddDemoObjects, "add_demo_objects"},
  {ControlKind::ClearDemoObjects, "clear_demo_objects"},
  {ControlKind::TogglePointcloud, "toggle_pointcloud"},
  {ControlKind::SetColorMode, "set_pointcloud_color_mode"},
  {ControlKind::SetDownsample, "set_pointcloud_downsample"},
  {ControlKind::ToggleDepth, "toggle_depth"},
  {ControlKind::ToggleObjects, "toggle_objects"},
  {ControlKind::ToggleGestures, "toggle_gestures"},
  {ControlKind::Ping, "ping"},
};

bool isRemoteControl(ControlKind kind) {
  return kind != ControlKind::AddDemoObjects && kind != ControlKind::ClearDemoObjects;
}

ParseResult parseControl(const std::string& json, ControlCommand& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    return fail("control: invalid JSON object");
  }

  std::string t = getStringOrEmpty(doc, "type");
  bool known = false;
  for (const auto& cn : kControlNames) {
    if (t == cn.name) { out.kind = cn.kind; known = true; break; }
  }
  if (!known) return fail("control: unknown type '" + t + "'");

  if (out.kind == ControlKind::AddDemoObjects) {
    std::string mode = getStringOrEmpty(doc, "mode");
    if (!mode.empty() && !parseDemoSet(mode, out.demoSet)) {
      return fail("add_demo_objects: unknown mode '" + mode + "'");
    }
  } else if (out.kind == ControlKind::SetColorMode) {
    if (!parseColorMode(getStringOrEmpty(doc, "mode"), out.colorMode)) {
      return fail("set_pointcloud_color_mode: mode must be rgb|depth|height|none");
    }
  } else if (out.kind == ControlKind::SetDownsample) {
    const auto* f = getMember(doc, "factor");
    if (!f || !f->IsInt()) return fail("set_pointcloud_downsample: missing int factor");
    out.downsample = f->GetInt();
    if (out.downsample < kMinDownsample || out.downsample > kMaxDownsample) {
      return fail("set_pointcloud_downsample: factor out of range 1..8");
    }
  }
  return {};
}

bool buildControl(const ControlCommand& cmd, std::string& out, std::string& err) {
  const char* name = nullptr;
  for (const auto& cn : kControlNames) {
    if (cn.kind == cmd.kind) { name = cn.name; break; }
  }
  if (!name) {
    err = "unknown control kind";
    return false;
  }
  if (cmd.kind == ControlKind::SetDownsample &&
      (cmd.downsample < kMinDownsample || cmd.downsample > kMaxDownsample)) {
    err = "downsample factor out of range 1..8";
    return false;
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("type"); w.String(name);
  switch (cmd.kind) {
    case ControlKind::AddDemoObjects:
      w.Key("mode"); w.String(demoSetName(cmd.demoSet));
      break;
    case ControlKind::SetColorMode:
      w.Key("mode"); w.String(colorModeName(cmd.colorMode));
      break;
    case ControlKind::SetDownsample:
      w.Key("factor"); w.Int(cmd.downsample);
      break;
    default:
      break;
  }
  w.EndObject();
  out = sb.GetString();
  return true;
}

} // namespace gt
