#include "gt/cloud/CloudCodec.hpp"

#include <zlib.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <limits>

namespace gt {

static std::uint32_t readU32LE(const std::uint8_t* p) {
  return static_cast<std::uint32_t>(p[0])
       | (static_cast<std::uint32_t>(p[1]) << 8)
       | (static_cast<std::uint32_t>(p[2]) << 16)
       | (static_cast<std::uint32_t>(p[3]) << 24);
}

static std::uint16_t readU16LE(const std::uint8_t* p) {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

static float readF32LE(const std::uint8_t* p) {
  std::uint32_t bits = readU32LE(p);
  float v;
  std::memcpy(&v, &bits, sizeof(v));
  return v;
}

static void writeU32LE(std::vector<std::uint8_t>& out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

static void writeU16LE(std::vector<std::uint8_t>& out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

static void writeF32LE(std::vector<std::uint8_t>& out, float v) {
  std::uint32_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  writeU32LE(out, bits);
}

static std::uint8_t colorByte(float c) {
  long v = std::lround(c * 255.0f);
  if (v < 0) v = 0;
  if (v > 255) v = 255;
  return static_cast<std::uint8_t>(v);
}

static DecodeResult corrupt(const std::string& message) {
  DecodeResult r;
  r.ok = false;
  r.error = ErrorKind::CorruptPayload;
  r.message = message;
  return r;
}

static DecodeResult emptyFrame(const DecodeMeta& meta) {
  DecodeResult r;
  r.frame.quantized = meta.quantized;
  r.frame.compressed = meta.compressed;
  return r;
}

// ---- quantization ----

std::uint16_t CloudCodec::quantizeAxis(float value, float min, float range) {
  if (!(range > 0.0f)) return 0;
  float t = (value - min) / range;
  if (!(t > 0.0f)) t = 0.0f;
  if (t > 1.0f) t = 1.0f;
  return static_cast<std::uint16_t>(std::lround(t * kQuantMax));
}

float CloudCodec::dequantizeAxis(std::uint16_t q, float min, float range) {
  return (static_cast<float>(q) / kQuantMax) * range + min;
}

QuantizationBounds CloudCodec::computeBounds(const std::vector<Vec3>& positions) {
  QuantizationBounds b;
  if (positions.empty()) {
    b.range = {kRangeEpsilon, kRangeEpsilon, kRangeEpsilon};
    return b;
  }
  Vec3 lo = positions.front();
  Vec3 hi = positions.front();
  for (const auto& p : positions) {
    lo.x = std::min(lo.x, p.x); hi.x = std::max(hi.x, p.x);
    lo.y = std::min(lo.y, p.y); hi.y = std::max(hi.y, p.y);
    lo.z = std::min(lo.z, p.z); hi.z = std::max(hi.z, p.z);
  }
  b.min = lo;
  b.range = {hi.x - lo.x + kRangeEpsilon,
             hi.y - lo.y + kRangeEpsilon,
             hi.z - lo.z + kRangeEpsilon};
  return b;
}

// ---- zlib ----

bool CloudCodec::inflateBytes(const std::uint8_t* data, std::size_t len,
                              std::vector<std::uint8_t>& out, std::string& err) {
  out.clear();
  if (len > std::numeric_limits<uInt>::max()) {
    err = "input too large";
    return false;
  }

  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  if (inflateInit(&zs) != Z_OK) {
    err = "inflateInit failed";
    return false;
  }

  zs.next_in = const_cast<Bytef*>(data);
  zs.avail_in = static_cast<uInt>(len);

  std::size_t chunk = std::max<std::size_t>(len * 4, 64 * 1024);
  int rc = Z_OK;
  while (rc == Z_OK) {
    std::size_t used = out.size();
    if (used + chunk > kMaxInflatedBytes) chunk = kMaxInflatedBytes - used;
    if (chunk == 0) {
      err = "inflated size exceeds limit";
      inflateEnd(&zs);
      out.clear();
      return false;
    }
    out.resize(used + chunk);
    zs.next_out = out.data() + used;
    zs.avail_out = static_cast<uInt>(chunk);

    rc = inflate(&zs, Z_NO_FLUSH);
    out.resize(used + (chunk - zs.avail_out));

    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      // All input consumed but the stream never ended.
      rc = Z_BUF_ERROR;
    }
  }

  if (rc != Z_STREAM_END) {
    err = zs.msg ? zs.msg : "truncated deflate stream";
    inflateEnd(&zs);
    out.clear();
    return false;
  }

  inflateEnd(&zs);
  return true;
}

bool CloudCodec::deflateBytes(const std::vector<std::uint8_t>& in, int level,
                              std::vector<std::uint8_t>& out) {
  uLongf destLen = compressBound(static_cast<uLong>(in.size()));
  out.resize(destLen);
  int rc = compress2(out.data(), &destLen, in.data(),
                     static_cast<uLong>(in.size()), level);
  if (rc != Z_OK) {
    out.clear();
    return false;
  }
  out.resize(destLen);
  return true;
}

// ---- decode ----

DecodeResult CloudCodec::decode(const std::vector<std::uint8_t>& payload,
                                const DecodeMeta& meta) {
  return decode(payload.data(), payload.size(), meta);
}

DecodeResult CloudCodec::decode(const std::uint8_t* data, std::size_t len,
                                const DecodeMeta& meta) {
  if (!data || len == 0) return emptyFrame(meta);

  const std::uint8_t* body = data;
  std::size_t bodyLen = len;

  std::vector<std::uint8_t> inflated;
  if (meta.compressed) {
    std::string err;
    if (!inflateBytes(data, len, inflated, err)) {
      return corrupt("inflate failed: " + err);
    }
    body = inflated.data();
    bodyLen = inflated.size();
    if (bodyLen == 0) return emptyFrame(meta);
  }

  if (bodyLen < HEADER_SIZE) {
    return corrupt("truncated header (" + std::to_string(bodyLen) + " bytes)");
  }

  std::uint32_t n = readU32LE(body);
  std::uint8_t colorFlag = body[4];
  if (colorFlag > 1) {
    return corrupt("invalid has_colors byte " + std::to_string(colorFlag));
  }

  DecodeResult result = emptyFrame(meta);
  PointCloudFrame& f = result.frame;
  f.hasColors = (colorFlag == 1);
  if (n == 0) return result;

  std::uint64_t posBytes = meta.quantized
      ? BOUNDS_SIZE + static_cast<std::uint64_t>(n) * 6u
      : static_cast<std::uint64_t>(n) * 12u;
  std::uint64_t colorBytes = f.hasColors ? static_cast<std::uint64_t>(n) * 3u : 0u;
  std::uint64_t needed = HEADER_SIZE + posBytes + colorBytes;
  if (needed > bodyLen) {
    return corrupt("point count " + std::to_string(n) + " needs " +
                   std::to_string(needed) + " bytes, body has " +
                   std::to_string(bodyLen));
  }

  const std::uint8_t* pos = body + HEADER_SIZE;
  f.positions.resize(n);

  if (meta.quantized) {
    QuantizationBounds& qb = f.bounds;
    qb.min = {readF32LE(pos), readF32LE(pos + 4), readF32LE(pos + 8)};
    qb.range = {readF32LE(pos + 12), readF32LE(pos + 16), readF32LE(pos + 20)};
    pos += BOUNDS_SIZE;
    for (std::uint32_t i = 0; i < n; ++i) {
      Vec3& p = f.positions[i];
      p.x = dequantizeAxis(readU16LE(pos), qb.min.x, qb.range.x);
      p.y = dequantizeAxis(readU16LE(pos + 2), qb.min.y, qb.range.y);
      p.z = dequantizeAxis(readU16LE(pos + 4), qb.min.z, qb.range.z);
      pos += 6;
    }
  } else {
    for (std::uint32_t i = 0; i < n; ++i) {
      Vec3& p = f.positions[i];
      p.x = readF32LE(pos);
      p.y = readF32LE(pos + 4);
      p.z = readF32LE(pos + 8);
      pos += 12;
    }
  }

  if (f.hasColors) {
    f.colors.resize(n);
    for (std::uint32_t i = 0; i < n; ++i) {
      f.colors[i] = {pos[0] / 255.0f, pos[1] / 255.0f, pos[2] / 255.0f};
      pos += 3;
    }
  }

  f.numPoints = n;
  return result;
}

// ---- encode ----

EncodeResult CloudCodec::encode(const std::vector<Vec3>& positions,
                                const std::vector<Rgb>& colors,
                                const EncodeOptions& opts) {
  auto t0 = std::chrono::steady_clock::now();
  EncodeResult result;

  if (!colors.empty() && colors.size() != positions.size()) {
    result.ok = false;
    result.message = "color count does not match point count";
    return result;
  }
  if (positions.size() > std::numeric_limits<std::uint32_t>::max()) {
    result.ok = false;
    result.message = "too many points";
    return result;
  }

  auto n = static_cast<std::uint32_t>(positions.size());
  bool hasColors = !colors.empty();

  std::vector<std::uint8_t> body;
  body.reserve(HEADER_SIZE + BOUNDS_SIZE +
               static_cast<std::size_t>(n) * (opts.quantize ? 6u : 12u) +
               (hasColors ? static_cast<std::size_t>(n) * 3u : 0u));
  writeU32LE(body, n);
  body.push_back(hasColors ? 1 : 0);

  if (opts.quantize) {
    QuantizationBounds qb = computeBounds(positions);
    writeF32LE(body, qb.min.x);
    writeF32LE(body, qb.min.y);
    writeF32LE(body, qb.min.z);
    writeF32LE(body, qb.range.x);
    writeF32LE(body, qb.range.y);
    writeF32LE(body, qb.range.z);
    for (const auto& p : positions) {
      writeU16LE(body, quantizeAxis(p.x, qb.min.x, qb.range.x));
      writeU16LE(body, quantizeAxis(p.y, qb.min.y, qb.range.y));
      writeU16LE(body, quantizeAxis(p.z, qb.min.z, qb.range.z));
    }
  } else {
    for (const auto& p : positions) {
      writeF32LE(body, p.x);
      writeF32LE(body, p.y);
      writeF32LE(body, p.z);
    }
  }

  for (const auto& c : colors) {
    body.push_back(colorByte(c.r));
    body.push_back(colorByte(c.g));
    body.push_back(colorByte(c.b));
  }

  if (opts.compress) {
    if (!deflateBytes(body, opts.compressionLevel, result.payload)) {
      result.ok = false;
      result.message = "deflate failed";
      return result;
    }
  } else {
    result.payload = std::move(body);
  }

  EncodeStats& s = result.stats;
  s.numPoints = n;
  s.rawBytes = static_cast<std::size_t>(n) * 12u * (hasColors ? 2u : 1u);
  s.encodedBytes = result.payload.size();
  s.compressionRatio = s.encodedBytes > 0
      ? static_cast<double>(s.rawBytes) / static_cast<double>(s.encodedBytes)
      : 0.0;
  s.encodeMicros = std::chrono::duration<double, std::micro>(
      std::chrono::steady_clock::now() - t0).count();
  return result;
}

} // namespace gt
