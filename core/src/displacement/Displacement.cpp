#include "dr/displacement/Displacement.hpp"
#include "dr/geometry/GeometryRegistry.hpp"

#include <algorithm>

namespace dr {

DragExtent measureExtent(const Rect& draggedBounds, const LayoutConfig& layout) {
  DragExtent e;
  e.width = draggedBounds.width() + layout.gapPx;
  e.height = draggedBounds.height() + layout.gapPx;
  return e;
}

int displacementDirection(int originIndex, int overIndex, int index) {
  if (originIndex < overIndex) {
    if (index > originIndex && index <= overIndex) return -1;
  } else if (originIndex > overIndex) {
    if (index >= overIndex && index < originIndex) return 1;
  }
  return 0;
}

Position computeDisplacement(int originIndex, int overIndex, int index,
                             const DragExtent& extent, const LayoutConfig& layout) {
  Position off;
  const int dir = displacementDirection(originIndex, overIndex, index);
  if (dir == 0) return off;

  switch (layout.strategy) {
    case LayoutStrategy::Horizontal:
      off.x = dir * extent.width;
      break;

    case LayoutStrategy::Grid: {
      // Move into the neighbouring slot, wrapping across rows.
      const int cols = std::max(1, layout.columns);
      const int target = index + dir;
      off.x = static_cast<double>(target % cols - index % cols) * extent.width;
      off.y = static_cast<double>(target / cols - index / cols) * extent.height;
      break;
    }

    case LayoutStrategy::Vertical:
    default:
      off.y = dir * extent.height;
      break;
  }
  return off;
}

std::vector<ItemDisplacement> DisplacementCalculator::computeAll(
    const std::string& draggedId, int originIndex, int overIndex,
    const GeometryRegistry& registry) const {
  std::vector<ItemDisplacement> out;

  ItemRecord dragged;
  if (!registry.get(draggedId, dragged)) return out;
  const DragExtent extent = measureExtent(dragged.bounds, layout_);

  for (const auto& rec : registry.records()) {
    if (rec.id == draggedId) continue;
    ItemDisplacement d;
    d.id = rec.id;
    d.index = rec.index;
    d.direction = displacementDirection(originIndex, overIndex, rec.index);
    d.offset = computeDisplacement(originIndex, overIndex, rec.index, extent, layout_);
    out.push_back(std::move(d));
  }
  return out;
}

} // namespace dr
