#pragma once
#include "dr/geometry/Types.hpp"

#include <cstdint>

namespace dr {

enum class PointerType : std::uint8_t { Mouse = 0, Touch, Pen };

enum class KeyCode : std::uint8_t { None = 0, Escape, Other };

// Generic pointer sample, not tied to any view library.
struct PointerEvent {
  double x{0}, y{0};       // viewport pixels
  PointerType type{PointerType::Mouse};
  int button{0};           // 0 = primary
  int touchCount{1};       // touch points down (touch only)

  Position position() const { return {x, y}; }
};

// Primary mouse/pen button, or exactly one touch point.
inline bool isPrimaryPointer(const PointerEvent& ev) {
  if (ev.type == PointerType::Touch) return ev.touchCount == 1;
  return ev.button == 0;
}

inline PointerEvent pointerAt(double x, double y) {
  PointerEvent ev;
  ev.x = x;
  ev.y = y;
  return ev;
}

} // namespace dr
