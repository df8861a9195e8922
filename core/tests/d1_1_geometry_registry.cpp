// D1.1: Geometry registry test (pure C++)
// Tests: register/get, last write wins, rejected input, unregister,
// registration order, live bounds providers, invalid measurements.

#include "dr/geometry/GeometryRegistry.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: register and query ---
  {
    dr::GeometryRegistry reg;
    requireTrue(reg.registerItem("a", 0, dr::Rect{0, 0, 200, 40}), "register a");
    requireTrue(reg.registerItem("b", 1, dr::Rect{0, 56, 200, 96}), "register b");
    requireTrue(reg.size() == 2, "size 2");

    dr::ItemRecord rec;
    requireTrue(reg.get("b", rec), "get b");
    requireTrue(rec.id == "b" && rec.index == 1, "b record id/index");
    requireTrue(rec.bounds.top == 56 && rec.bounds.bottom == 96, "b bounds");
    requireTrue(!rec.disabled, "b enabled by default");

    requireTrue(reg.indexOf("a") == 0, "indexOf a");
    requireTrue(reg.indexOf("zzz") == -1, "indexOf unknown");
    requireTrue(reg.idAtIndex(1) == "b", "idAtIndex 1");
    requireTrue(reg.idAtIndex(7).empty(), "idAtIndex unknown");
    std::printf("  Test 1 (register/query) PASS\n");
  }

  // --- Test 2: last write wins, order kept ---
  {
    dr::GeometryRegistry reg;
    reg.registerItem("a", 0, dr::Rect{0, 0, 200, 40});
    reg.registerItem("b", 1, dr::Rect{0, 56, 200, 96});
    reg.registerItem("a", 3, dr::Rect{0, 168, 200, 208}, true);

    requireTrue(reg.size() == 2, "replace does not grow");
    requireTrue(reg.indexOf("a") == 3, "a index replaced");

    dr::ItemRecord rec;
    reg.get("a", rec);
    requireTrue(rec.bounds.top == 168, "a bounds replaced");
    requireTrue(rec.disabled, "a disabled flag replaced");

    auto all = reg.records();
    requireTrue(all.size() == 2, "records size");
    requireTrue(all[0].id == "a" && all[1].id == "b", "registration order stable");
    std::printf("  Test 2 (last write wins) PASS\n");
  }

  // --- Test 3: rejected registrations leave registry untouched ---
  {
    dr::GeometryRegistry reg;
    reg.registerItem("a", 0, dr::Rect{0, 0, 200, 40});

    requireTrue(!reg.registerItem("", 1, dr::Rect{0, 0, 10, 10}), "empty id rejected");
    requireTrue(!reg.registerItem("b", -1, dr::Rect{0, 0, 10, 10}), "negative index rejected");
    requireTrue(!reg.registerItem("b", 1, dr::Rect{0, 50, 10, 10}), "inverted bounds rejected");
    const double nan = std::numeric_limits<double>::quiet_NaN();
    requireTrue(!reg.registerItem("b", 1, dr::Rect{0, nan, 10, 10}), "NaN bounds rejected");
    requireTrue(!reg.registerItem("a", 2, dr::Rect{10, 0, 0, 10}), "bad replace rejected");
    requireTrue(!reg.registerItem("c", 2, dr::BoundsProvider{}), "null provider rejected");

    requireTrue(reg.size() == 1, "still one item");
    requireTrue(reg.indexOf("a") == 0, "a untouched");
    std::printf("  Test 3 (rejections) PASS\n");
  }

  // --- Test 4: unregister ---
  {
    dr::GeometryRegistry reg;
    reg.registerItem("a", 0, dr::Rect{0, 0, 200, 40});
    reg.registerItem("b", 1, dr::Rect{0, 56, 200, 96});
    reg.registerItem("c", 2, dr::Rect{0, 112, 200, 152});

    reg.unregisterItem("nope");
    requireTrue(reg.size() == 3, "unknown unregister is a no-op");

    reg.unregisterItem("b");
    requireTrue(reg.size() == 2, "b removed");
    requireTrue(!reg.contains("b"), "b gone");
    requireTrue(reg.indexOf("c") == 2, "c still reachable after erase");

    auto all = reg.records();
    requireTrue(all[0].id == "a" && all[1].id == "c", "order after erase");

    reg.clear();
    requireTrue(reg.size() == 0 && !reg.contains("a"), "clear");
    std::printf("  Test 4 (unregister) PASS\n");
  }

  // --- Test 5: bounds provider measured on demand ---
  {
    dr::GeometryRegistry reg;
    double scroll = 0;
    reg.registerItem("a", 0, [&scroll] { return dr::Rect{0, 100 - scroll, 200, 140 - scroll}; });

    dr::ItemRecord rec;
    reg.get("a", rec);
    requireTrue(rec.bounds.top == 100, "provider initial top");

    scroll = 30;
    reg.get("a", rec);
    requireTrue(rec.bounds.top == 70, "provider follows scroll");
    requireTrue(reg.records()[0].bounds.bottom == 110, "records() measures live");
    std::printf("  Test 5 (bounds provider) PASS\n");
  }

  // --- Test 6: invalid provider measurements ---
  {
    dr::GeometryRegistry reg;
    const double nan = std::numeric_limits<double>::quiet_NaN();
    requireTrue(!reg.registerItem("x", 0, [nan] { return dr::Rect{nan, 0, 10, 10}; }),
                "provider invalid at registration rejected");
    requireTrue(reg.size() == 0, "nothing stored");

    bool broken = false;
    reg.registerItem("a", 0, [&broken, nan] {
      return broken ? dr::Rect{0, nan, 200, 40} : dr::Rect{0, 0, 200, 40};
    });
    broken = true;
    dr::ItemRecord rec;
    requireTrue(reg.get("a", rec), "still registered");
    requireTrue(rec.bounds.isValid() && rec.bounds.bottom == 40, "last good bounds kept");
    requireTrue(reg.records()[0].bounds.isValid(), "records() never reports invalid bounds");

    broken = false;
    reg.registerItem("b", 1, [] { return dr::Rect{0, 50, 200, 90}; });
    reg.get("b", rec);
    requireTrue(rec.bounds.top == 50, "valid provider unaffected");
    std::printf("  Test 6 (invalid measurements) PASS\n");
  }

  std::printf("D1.1 geometry registry: ALL PASS\n");
  return 0;
}
