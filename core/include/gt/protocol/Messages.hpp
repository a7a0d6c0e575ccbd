#pragma once
#include "gt/ErrorKind.hpp"
#include "gt/interaction/HandObservation.hpp"
#include "gt/math/Vec.hpp"
#include "gt/scene/DemoObjects.hpp"
#include "gt/scene/DetectionTracker.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <rapidjson/document.h>

namespace gt {

enum class MessageType : std::uint8_t {
  Unknown = 0,
  Frame,
  Welcome,
  PointcloudToggled,
  ColorModeChanged,
  DownsampleChanged,
  DepthToggled,
  ObjectsToggled,
  GesturesToggled,
  Pong,
  Error
};

enum class ColorMode : std::uint8_t { Rgb, Depth, Height, None };

const char* colorModeName(ColorMode m);
bool parseColorMode(const std::string& s, ColorMode& out);

// Capture-side feature flags as last reported by the server.
struct RemoteFlags {
  bool depthEnabled{true};
  bool objectsEnabled{true};
  bool gesturesEnabled{true};
  bool pointcloudEnabled{true};
  ColorMode colorMode{ColorMode::Rgb};
  int downsample{4};
};

// "pointcloud" member of a frame; data stays base64 until the tick decodes it.
struct PointCloudEnvelope {
  bool present{false};
  std::uint32_t numPoints{0};
  bool compressed{false};
  bool quantized{false};
  bool hasColors{false};
  std::string data;
};

struct FrameMessage {
  std::int64_t timestampMs{0};
  std::uint64_t frameNumber{0};
  bool hasObjects{false};
  std::vector<Detection> objects;
  std::vector<HandObservation> hands;
  PointCloudEnvelope pointcloud;
};

struct InboundMessage {
  MessageType type{MessageType::Unknown};
  std::string typeName;
  FrameMessage frame;  // Frame
  RemoteFlags flags;   // Welcome
  bool enabled{false}; // *_toggled acks
  ColorMode colorMode{ColorMode::Rgb};
  int downsample{0};
  std::string text;    // welcome/error message
};

struct ParseResult {
  bool ok{true};
  ErrorKind error{ErrorKind::None};
  std::string message;
};

// Unknown "type" values parse successfully as MessageType::Unknown.
ParseResult parseMessage(const std::string& json, InboundMessage& out);

// Folds an acknowledgement or welcome into flags. Returns true if the
// message carried flag state.
bool applyRemoteFlags(const InboundMessage& msg, RemoteFlags& flags);

// ---- control requests ----

enum class ControlKind : std::uint8_t {
  AddDemoObjects,
  ClearDemoObjects,
  TogglePointcloud,
  SetColorMode,
  SetDownsample,
  ToggleDepth,
  ToggleObjects,
  ToggleGestures,
  Ping
};

struct ControlCommand {
  ControlKind kind{ControlKind::Ping};
  DemoSet demoSet{DemoSet::Shapes2d};
  ColorMode colorMode{ColorMode::Rgb};
  int downsample{1};
};

inline constexpr int kMinDownsample = 1;
inline constexpr int kMaxDownsample = 8;

// Parses a {"type": "..."} control envelope.
ParseResult parseControl(const std::string& json, ControlCommand& out);

// Serializes a control envelope; fails for out-of-range arguments.
bool buildControl(const ControlCommand& cmd, std::string& out, std::string& err);

// True for requests the capture server acts on; the rest are local.
bool isRemoteControl(ControlKind kind);

} // namespace gt
