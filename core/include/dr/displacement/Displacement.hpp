#pragma once
#include "dr/geometry/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace dr {

class GeometryRegistry;

enum class LayoutStrategy : std::uint8_t { Vertical = 0, Horizontal, Grid };

struct LayoutConfig {
  LayoutStrategy strategy{LayoutStrategy::Vertical};
  double gapPx{16.0};   // spacing between neighbouring items
  int columns{1};       // Grid only
  double transitionMs{200.0};  // displaced items ease into place over this
};

// Dragged item size plus gap: the distance one slot occupies.
struct DragExtent {
  double width{0};
  double height{0};
};

struct ItemDisplacement {
  std::string id;
  int index{-1};
  int direction{0};   // -1 toward lower indices, +1 toward higher, 0 none
  Position offset;
};

DragExtent measureExtent(const Rect& draggedBounds, const LayoutConfig& layout);

// -1 when originIndex < index <= overIndex,
// +1 when overIndex <= index < originIndex, else 0.
int displacementDirection(int originIndex, int overIndex, int index);

// Pure function of its arguments; identical inputs give identical offsets.
Position computeDisplacement(int originIndex, int overIndex, int index,
                             const DragExtent& extent, const LayoutConfig& layout);

// Per-item offsets for every registered item except the dragged one.
class DisplacementCalculator {
public:
  void setLayout(const LayoutConfig& layout) { layout_ = layout; }
  const LayoutConfig& layout() const { return layout_; }

  // Empty when the dragged item is not registered.
  std::vector<ItemDisplacement> computeAll(const std::string& draggedId,
                                           int originIndex, int overIndex,
                                           const GeometryRegistry& registry) const;

private:
  LayoutConfig layout_;
};

} // namespace dr
