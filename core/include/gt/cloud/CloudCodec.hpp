#pragma once
#include "gt/cloud/PointCloudFrame.hpp"
#include "gt/ErrorKind.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gt {

// Point-cloud wire format (little-endian):
//   [u32 numPoints][u8 hasColors]
//   quantized: [6 x f32 min.xyz range.xyz] then numPoints x [3 x u16]
//   raw:       numPoints x [3 x f32]
//   hasColors: numPoints x [3 x u8]
// The whole block may be zlib-deflated.

struct DecodeMeta {
  bool quantized{false};
  bool compressed{false};
  std::uint32_t numPointsHint{0}; // 0 = unknown
};

struct DecodeResult {
  bool ok{true};
  ErrorKind error{ErrorKind::None};
  std::string message;
  PointCloudFrame frame; // empty unless ok
};

struct EncodeOptions {
  bool quantize{true};
  bool compress{true};
  int compressionLevel{6}; // zlib level 1..9
};

struct EncodeStats {
  std::uint32_t numPoints{0};
  std::size_t rawBytes{0};     // positions + colors as f32
  std::size_t encodedBytes{0}; // final payload size
  double compressionRatio{0};
  double encodeMicros{0};
};

struct EncodeResult {
  bool ok{true};
  std::string message;
  std::vector<std::uint8_t> payload;
  EncodeStats stats;
};

class CloudCodec {
public:
  static constexpr std::size_t HEADER_SIZE = 5;
  static constexpr std::size_t BOUNDS_SIZE = 24;
  static constexpr float kQuantMax = 65535.0f;
  static constexpr float kRangeEpsilon = 1e-6f;

  // Upper bound on an inflated body; larger streams are treated as corrupt.
  static constexpr std::size_t kMaxInflatedBytes = 256u * 1024u * 1024u;

  // Never partially fills a frame: either ok with a complete frame or
  // CorruptPayload with an empty one. An empty payload is a 0-point frame.
  static DecodeResult decode(const std::uint8_t* data, std::size_t len,
                             const DecodeMeta& meta);
  static DecodeResult decode(const std::vector<std::uint8_t>& payload,
                             const DecodeMeta& meta);

  // colors may be empty (no color block) or match positions in size.
  static EncodeResult encode(const std::vector<Vec3>& positions,
                             const std::vector<Rgb>& colors,
                             const EncodeOptions& opts);

  // Tight per-axis bounds: range = max - min + epsilon.
  static QuantizationBounds computeBounds(const std::vector<Vec3>& positions);

  static std::uint16_t quantizeAxis(float value, float min, float range);
  static float dequantizeAxis(std::uint16_t q, float min, float range);

  // zlib stream helpers (RFC 1950 framing).
  static bool inflateBytes(const std::uint8_t* data, std::size_t len,
                           std::vector<std::uint8_t>& out, std::string& err);
  static bool deflateBytes(const std::vector<std::uint8_t>& in, int level,
                           std::vector<std::uint8_t>& out);
};

} // namespace gt
