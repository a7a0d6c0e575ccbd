#include "gt/cloud/Base64.hpp"

namespace gt {

static const char* kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int sextet(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

std::string base64Encode(const std::vector<std::uint8_t>& in) {
  std::string out;
  out.reserve(((in.size() + 2) / 3) * 4);
  std::size_t i = 0;
  while (i < in.size()) {
    std::uint32_t val = 0;
    int bytes = 0;
    for (int j = 0; j < 3; ++j) {
      val <<= 8;
      if (i < in.size()) { val |= in[i++]; ++bytes; }
    }
    int pad = 3 - bytes;
    for (int k = 0; k < 4 - pad; ++k) {
      out.push_back(kAlphabet[(val >> (18 - k * 6)) & 0x3F]);
    }
    for (int k = 0; k < pad; ++k) out.push_back('=');
  }
  return out;
}

bool base64Decode(const std::string& in, std::vector<std::uint8_t>& out) {
  out.clear();
  out.reserve((in.size() / 4) * 3);

  std::uint32_t acc = 0;
  int bits = 0;
  std::size_t padding = 0;
  std::size_t symbols = 0;

  for (char c : in) {
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
    if (c == '=') {
      ++padding;
      continue;
    }
    if (padding > 0) { out.clear(); return false; } // data after padding
    int v = sextet(c);
    if (v < 0) { out.clear(); return false; }
    ++symbols;
    acc = (acc << 6) | static_cast<std::uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
    }
  }

  // A lone trailing sextet cannot carry a whole byte.
  if (symbols % 4 == 1 || padding > 2) {
    out.clear();
    return false;
  }
  if (padding > 0 && (symbols + padding) % 4 != 0) {
    out.clear();
    return false;
  }
  return true;
}

} // namespace gt
