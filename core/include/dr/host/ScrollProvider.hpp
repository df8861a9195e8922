#pragma once
#include "dr/geometry/Types.hpp"

#include <functional>
#include <memory>

namespace dr {

struct ScrollMetrics {
  Rect visibleBounds;   // container rect, viewport coordinates
  Position offset;      // current scroll offset
  Position maxOffset;   // largest reachable offset per axis
};

// A scrollable container supplied by the host.
class ScrollProvider {
public:
  virtual ~ScrollProvider() = default;
  virtual ScrollMetrics metrics() const = 0;

  // Scroll by delta; returns the delta actually applied (clamped at bounds).
  virtual Position scrollBy(const Position& delta) = 0;
};

// Receives the resolved container, or nullptr when resolution failed.
using ScrollResolveCallback = std::function<void(std::shared_ptr<ScrollProvider>)>;

// Finds the container that scrolls a given item. May complete synchronously
// or at any later point on the host's event loop.
class ScrollResolver {
public:
  virtual ~ScrollResolver() = default;
  virtual void resolve(const ItemRecord& item, ScrollResolveCallback done) = 0;
};

} // namespace dr
