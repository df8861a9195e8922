#pragma once
#include "dr/geometry/Types.hpp"

#include <string>

namespace dr {

class GeometryRegistry;

struct HitResult {
  bool hit{false};
  std::string id;
  int index{-1};
};

// Resolves which registered item contains a point.
// Overlapping bounds resolve to the first match in registration order; no
// spatial priority is applied.
class HitTester {
public:
  HitResult locate(const Position& p, const GeometryRegistry& registry,
                   const std::string& excludeId) const;
};

} // namespace dr
