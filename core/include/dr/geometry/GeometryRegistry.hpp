#pragma once
#include "dr/geometry/Types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dr {

// Live measurement of an item's bounds (viewport coordinates). An invalid
// measurement is ignored and the last valid one is reported instead.
using BoundsProvider = std::function<Rect()>;

// Tracks id -> (index, bounds) for every mounted item.
// Callers re-register on mount, resize and reorder; there is no invalidation
// signal of its own. Iteration follows registration order.
class GeometryRegistry {
public:
  // Insert or replace (last write wins). Returns false and leaves the
  // registry untouched on an empty id, negative index or invalid bounds.
  // A provider is measured once here and must give valid bounds.
  bool registerItem(const std::string& id, int index, const Rect& bounds,
                    bool disabled = false);
  bool registerItem(const std::string& id, int index, BoundsProvider provider,
                    bool disabled = false);

  // No-op for unknown ids.
  void unregisterItem(const std::string& id);
  void clear();

  bool get(const std::string& id, ItemRecord& out) const;
  int indexOf(const std::string& id) const;
  bool contains(const std::string& id) const;
  std::size_t size() const { return entries_.size(); }

  // Snapshot of all records with bounds measured now.
  std::vector<ItemRecord> records() const;

  // Id registered at the given index, or empty.
  std::string idAtIndex(int index) const;

private:
  struct Entry {
    // Provider entries cache their last valid measurement here.
    mutable ItemRecord record;
    BoundsProvider provider;
    mutable bool staleLogged{false};
  };

  bool upsert(Entry entry);
  ItemRecord resolve(const Entry& e) const;
  void rebuildSlots();

  std::vector<Entry> entries_;
  std::unordered_map<std::string, std::size_t> slots_;
};

} // namespace dr
