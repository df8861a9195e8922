// D2.1: Displacement test (pure C++)
// Tests: direction table, vertical/horizontal/grid offsets, symmetry,
// computeAll exclusion.

#include "dr/displacement/Displacement.hpp"
#include "dr/geometry/GeometryRegistry.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: direction table ---
  {
    // Dragging down 1 -> 3: items 2 and 3 move up.
    requireTrue(dr::displacementDirection(1, 3, 0) == 0, "down: before origin");
    requireTrue(dr::displacementDirection(1, 3, 2) == -1, "down: between");
    requireTrue(dr::displacementDirection(1, 3, 3) == -1, "down: at over");
    requireTrue(dr::displacementDirection(1, 3, 4) == 0, "down: after over");

    // Dragging up 3 -> 1: items 1 and 2 move down.
    requireTrue(dr::displacementDirection(3, 1, 0) == 0, "up: before over");
    requireTrue(dr::displacementDirection(3, 1, 1) == 1, "up: at over");
    requireTrue(dr::displacementDirection(3, 1, 2) == 1, "up: between");
    requireTrue(dr::displacementDirection(3, 1, 4) == 0, "up: after origin");

    for (int i = 0; i < 5; i++) {
      requireTrue(dr::displacementDirection(2, 2, i) == 0, "over == origin moves nothing");
    }
    std::printf("  Test 1 (direction table) PASS\n");
  }

  // --- Test 2: vertical offsets use height + gap ---
  {
    dr::LayoutConfig lay;   // vertical, gap 16
    dr::DragExtent e = dr::measureExtent(dr::Rect{0, 0, 200, 40}, lay);
    requireClose(e.height, 56, 1e-9, "extent height");

    dr::Position p = dr::computeDisplacement(0, 2, 1, e, lay);
    requireClose(p.x, 0, 1e-9, "vertical x untouched");
    requireClose(p.y, -56, 1e-9, "vertical shift up");

    p = dr::computeDisplacement(3, 0, 1, e, lay);
    requireClose(p.y, 56, 1e-9, "vertical shift down");
    std::printf("  Test 2 (vertical) PASS\n");
  }

  // --- Test 3: horizontal offsets use width + gap ---
  {
    dr::LayoutConfig lay;
    lay.strategy = dr::LayoutStrategy::Horizontal;
    lay.gapPx = 8;
    dr::DragExtent e = dr::measureExtent(dr::Rect{0, 0, 120, 40}, lay);

    dr::Position p = dr::computeDisplacement(0, 2, 2, e, lay);
    requireClose(p.x, -128, 1e-9, "horizontal shift left");
    requireClose(p.y, 0, 1e-9, "horizontal y untouched");
    std::printf("  Test 3 (horizontal) PASS\n");
  }

  // --- Test 4: grid moves to the neighbouring slot with row wrap ---
  {
    dr::LayoutConfig lay;
    lay.strategy = dr::LayoutStrategy::Grid;
    lay.gapPx = 10;
    lay.columns = 3;
    dr::DragExtent e = dr::measureExtent(dr::Rect{0, 0, 100, 50}, lay);   // 110 x 60

    // Dragging 0 -> 4: index 3 wraps back to the end of row 0.
    dr::Position p = dr::computeDisplacement(0, 4, 3, e, lay);
    requireClose(p.x, 220, 1e-9, "grid wrap x");
    requireClose(p.y, -60, 1e-9, "grid wrap y");

    p = dr::computeDisplacement(0, 4, 4, e, lay);
    requireClose(p.x, -110, 1e-9, "grid same row x");
    requireClose(p.y, 0, 1e-9, "grid same row y");

    // Dragging 5 -> 1: index 2 wraps forward to the start of row 1.
    p = dr::computeDisplacement(5, 1, 2, e, lay);
    requireClose(p.x, -220, 1e-9, "grid forward wrap x");
    requireClose(p.y, 60, 1e-9, "grid forward wrap y");
    std::printf("  Test 4 (grid) PASS\n");
  }

  // --- Test 5: symmetric and pure ---
  {
    dr::LayoutConfig lay;
    dr::DragExtent e = dr::measureExtent(dr::Rect{0, 0, 200, 40}, lay);
    for (int i = 0; i < 6; i++) {
      dr::Position a = dr::computeDisplacement(1, 4, i, e, lay);
      dr::Position b = dr::computeDisplacement(1, 4, i, e, lay);
      requireTrue(a == b, "same inputs, same offset");

      // Mirror: dragging 4 -> 1 moves the shifted band by the opposite amount.
      dr::Position m = dr::computeDisplacement(4, 1, i, e, lay);
      int downBand = (i > 1 && i <= 4) ? 1 : 0;
      int upBand = (i >= 1 && i < 4) ? 1 : 0;
      requireClose(a.y, -56.0 * downBand, 1e-9, "down band");
      requireClose(m.y, 56.0 * upBand, 1e-9, "up band");
    }
    std::printf("  Test 5 (symmetry) PASS\n");
  }

  // --- Test 6: computeAll skips the dragged item ---
  {
    dr::GeometryRegistry reg;
    for (int i = 0; i < 4; i++) {
      reg.registerItem(std::string(1, static_cast<char>('a' + i)), i,
                       dr::Rect{0, i * 56.0, 200, i * 56.0 + 40});
    }
    dr::DisplacementCalculator calc;
    auto all = calc.computeAll("a", 0, 2, reg);
    requireTrue(all.size() == 3, "three displaced entries");
    for (const auto& d : all) {
      requireTrue(d.id != "a", "dragged excluded");
      if (d.id == "b" || d.id == "c") {
        requireTrue(d.direction == -1, "b/c move up");
        requireClose(d.offset.y, -56, 1e-9, "b/c offset");
      } else {
        requireTrue(d.direction == 0 && dr::isZero(d.offset), "d stays");
      }
    }

    requireTrue(calc.computeAll("ghost", 0, 2, reg).empty(), "unknown dragged -> empty");
    std::printf("  Test 6 (computeAll) PASS\n");
  }

  std::printf("D2.1 displacement: ALL PASS\n");
  return 0;
}
