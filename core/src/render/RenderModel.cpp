#include "dr/render/RenderModel.hpp"
#include "dr/geometry/GeometryRegistry.hpp"

namespace dr {

ItemVisual computeItemVisual(const DragSessionState& state,
                             const std::string& id, int index,
                             const GeometryRegistry& registry,
                             const LayoutConfig& layout) {
  ItemVisual v;
  if (!state.isDragging()) return v;

  if (id == state.draggedId) {
    v.dragging = true;
    v.offset = state.dragTransform();
    return v;
  }

  v.animate = layout.transitionMs > 0.0;
  v.transitionMs = layout.transitionMs;
  v.over = index == state.overIndex;

  ItemRecord dragged;
  if (!registry.get(state.draggedId, dragged)) return v;

  const DragExtent extent = measureExtent(dragged.bounds, layout);
  v.offset = computeDisplacement(state.originIndex, state.overIndex, index, extent, layout);
  return v;
}

bool overlayOrigin(const DragSessionState& state, Position& out) {
  if (!state.isDragging()) return false;
  out = state.overlayOrigin();
  return true;
}

} // namespace dr
