#pragma once
#include "dr/geometry/Types.hpp"

#include <functional>
#include <string>

namespace dr {

struct DragStartEvent {
  std::string id;
  int originIndex{-1};
};

struct DragMoveEvent {
  std::string id;
  Position position;
  Position deltaFromStart;
};

// Emitted only when overIndex changes.
struct DragOverEvent {
  std::string id;
  int overIndex{-1};
  bool hasOverItem{false};
  std::string overItemId;
};

// fromIndex == toIndex when nothing moved; cancelled is true only for an
// explicit cancellation (or a forced one), never because the index is unchanged.
struct DragEndEvent {
  std::string id;
  int fromIndex{-1};
  int toIndex{-1};
  bool cancelled{false};
};

struct DragCallbacks {
  std::function<void(const DragStartEvent&)> onDragStart;
  std::function<void(const DragMoveEvent&)> onDragMove;
  std::function<void(const DragOverEvent&)> onDragOver;
  std::function<void(const DragEndEvent&)> onDragEnd;
};

} // namespace dr
