#include "dr/geometry/HitTester.hpp"
#include "dr/geometry/GeometryRegistry.hpp"

namespace dr {

HitResult HitTester::locate(const Position& p, const GeometryRegistry& registry,
                            const std::string& excludeId) const {
  HitResult result;
  for (const auto& rec : registry.records()) {
    if (rec.id == excludeId) continue;
    if (rec.bounds.contains(p)) {
      result.hit = true;
      result.id = rec.id;
      result.index = rec.index;
      break;
    }
  }
  return result;
}

} // namespace dr
