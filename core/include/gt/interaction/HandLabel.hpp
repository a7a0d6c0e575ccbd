#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace gt {

// Fixed per-tick processing order is the enum order: Left, then Right.
enum class HandLabel : std::uint8_t { Left = 0, Right = 1 };

inline constexpr std::size_t kHandCount = 2;

inline std::size_t handIndex(HandLabel h) { return static_cast<std::size_t>(h); }

inline HandLabel handAt(std::size_t index) {
  return index == 0 ? HandLabel::Left : HandLabel::Right;
}

inline const char* handLabelName(HandLabel h) {
  return h == HandLabel::Left ? "Left" : "Right";
}

// Accepts "Left"/"Right" in any case.
inline bool parseHandLabel(const std::string& s, HandLabel& out) {
  std::string lower;
  for (char c : s) lower += static_cast<char>((c >= 'A' && c <= 'Z') ? c + 32 : c);
  if (lower == "left")  { out = HandLabel::Left;  return true; }
  if (lower == "right") { out = HandLabel::Right; return true; }
  return false;
}

} // namespace gt
