#pragma once
#include <cmath>
#include <string>

namespace dr {

// Viewport coordinates, pixels, 0 = left/top.
struct Position {
  double x{0}, y{0};
};

inline Position operator+(const Position& a, const Position& b) { return {a.x + b.x, a.y + b.y}; }
inline Position operator-(const Position& a, const Position& b) { return {a.x - b.x, a.y - b.y}; }
inline bool operator==(const Position& a, const Position& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }

inline bool isZero(const Position& p) { return p.x == 0.0 && p.y == 0.0; }

inline double distance(const Position& a, const Position& b) {
  return std::sqrt((a.x - b.x) * (a.x - b.x) + (a.y - b.y) * (a.y - b.y));
}

struct Rect {
  double left{0}, top{0}, right{0}, bottom{0};

  double width() const { return right - left; }
  double height() const { return bottom - top; }
  Position topLeft() const { return {left, top}; }

  // Closed interval on all four edges.
  bool contains(const Position& p) const {
    return p.x >= left && p.x <= right && p.y >= top && p.y <= bottom;
  }

  bool isValid() const {
    return std::isfinite(left) && std::isfinite(top) &&
           std::isfinite(right) && std::isfinite(bottom) &&
           right >= left && bottom >= top;
  }
};

// One orderable item as known to the GeometryRegistry.
struct ItemRecord {
  std::string id;
  int index{-1};
  Rect bounds;
  bool disabled{false};
};

} // namespace dr
