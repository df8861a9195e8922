#pragma once
#include "dr/displacement/Displacement.hpp"
#include "dr/geometry/Types.hpp"
#include "dr/session/DragState.hpp"

#include <string>

namespace dr {

class GeometryRegistry;

// What a host needs to draw one item for the current snapshot.
struct ItemVisual {
  bool dragging{false};   // this item is being dragged
  bool over{false};       // not dragged, and sits at overIndex
  bool animate{false};    // hosts apply a transition to `offset`
  double transitionMs{0}; // duration of that transition, 0 when !animate
  Position offset;        // translation to apply this frame
};

// Derived purely from the snapshot, so a late render never disagrees with it.
// Dragged item: offset = dragTransform(). Others: displacement toward the
// vacated slot while another item is dragged, zero otherwise.
ItemVisual computeItemVisual(const DragSessionState& state,
                             const std::string& id, int index,
                             const GeometryRegistry& registry,
                             const LayoutConfig& layout);

// Overlay top-left for a pointer-anchored drag preview. False when idle.
bool overlayOrigin(const DragSessionState& state, Position& out);

} // namespace dr
