#pragma once
#include "dr/geometry/Types.hpp"

#include <cstdint>
#include <string>

namespace dr {

enum class DragPhase : std::uint8_t { Idle = 0, Pending, Active, Ending };

const char* toString(DragPhase phase);

// The single mutable snapshot of a gesture. Written only by DragSession;
// everyone else receives copies. draggedId is non-empty exactly when the
// phase is Active or Ending.
struct DragSessionState {
  DragPhase phase{DragPhase::Idle};

  std::string draggedId;
  int originIndex{-1};
  int overIndex{-1};

  Position initialPosition;
  Position currentPosition;
  Position pointerOffsetWithinItem;   // press point relative to item top-left
  Position accumulatedScrollDelta;    // auto-scroll since activation

  bool isDragging() const { return phase == DragPhase::Active; }

  // Translation keeping the dragged item under the pointer while content scrolls.
  Position dragTransform() const {
    return currentPosition - initialPosition + accumulatedScrollDelta;
  }

  // Top-left of a pointer-anchored overlay.
  Position overlayOrigin() const {
    return currentPosition - pointerOffsetWithinItem;
  }
};

std::string serializeDragState(const DragSessionState& state);

} // namespace dr
