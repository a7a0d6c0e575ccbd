#pragma once
#include <cmath>

namespace gt {

struct Vec2 {
  float x{0}, y{0};
};

struct Vec3 {
  float x{0}, y{0}, z{0};
};

inline Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
inline Vec3 operator+(Vec3 a, Vec3 b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(Vec3 a, Vec3 b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }

inline float length(Vec2 v) { return std::sqrt(v.x * v.x + v.y * v.y); }
inline float length(Vec3 v) { return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z); }

// Axis-aligned rectangle in surface pixels, top-left origin.
struct Rect {
  float x{0}, y{0}, width{0}, height{0};

  Vec2 center() const { return {x + width * 0.5f, y + height * 0.5f}; }
  float area() const { return width * height; }
  bool contains(Vec2 p) const {
    return p.x >= x && p.x <= x + width && p.y >= y && p.y <= y + height;
  }
};

} // namespace gt
