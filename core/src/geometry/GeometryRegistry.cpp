#include "dr/geometry/GeometryRegistry.hpp"

#include <cstdio>
#include <utility>

namespace dr {

bool GeometryRegistry::registerItem(const std::string& id, int index,
                                    const Rect& bounds, bool disabled) {
  if (!bounds.isValid()) {
    std::fprintf(stderr, "GeometryRegistry: rejected '%s' (invalid bounds)\n", id.c_str());
    return false;
  }
  Entry e;
  e.record.id = id;
  e.record.index = index;
  e.record.bounds = bounds;
  e.record.disabled = disabled;
  return upsert(std::move(e));
}

bool GeometryRegistry::registerItem(const std::string& id, int index,
                                    BoundsProvider provider, bool disabled) {
  if (!provider) {
    std::fprintf(stderr, "GeometryRegistry: rejected '%s' (no bounds provider)\n", id.c_str());
    return false;
  }
  const Rect initial = provider();
  if (!initial.isValid()) {
    std::fprintf(stderr, "GeometryRegistry: rejected '%s' (provider gave invalid bounds)\n",
                 id.c_str());
    return false;
  }
  Entry e;
  e.record.id = id;
  e.record.index = index;
  e.record.bounds = initial;
  e.record.disabled = disabled;
  e.provider = std::move(provider);
  return upsert(std::move(e));
}

bool GeometryRegistry::upsert(Entry entry) {
  if (entry.record.id.empty()) {
    std::fprintf(stderr, "GeometryRegistry: rejected registration without id\n");
    return false;
  }
  if (entry.record.index < 0) {
    std::fprintf(stderr, "GeometryRegistry: rejected '%s' (index %d)\n",
                 entry.record.id.c_str(), entry.record.index);
    return false;
  }

  auto it = slots_.find(entry.record.id);
  if (it != slots_.end()) {
    // Replace in place so registration order is stable across updates.
    entries_[it->second] = std::move(entry);
    return true;
  }

  slots_.emplace(entry.record.id, entries_.size());
  entries_.push_back(std::move(entry));
  return true;
}

void GeometryRegistry::unregisterItem(const std::string& id) {
  auto it = slots_.find(id);
  if (it == slots_.end()) return;
  entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
  rebuildSlots();
}

void GeometryRegistry::clear() {
  entries_.clear();
  slots_.clear();
}

bool GeometryRegistry::get(const std::string& id, ItemRecord& out) const {
  auto it = slots_.find(id);
  if (it == slots_.end()) return false;
  out = resolve(entries_[it->second]);
  return true;
}

int GeometryRegistry::indexOf(const std::string& id) const {
  auto it = slots_.find(id);
  if (it == slots_.end()) return -1;
  return entries_[it->second].record.index;
}

bool GeometryRegistry::contains(const std::string& id) const {
  return slots_.find(id) != slots_.end();
}

std::vector<ItemRecord> GeometryRegistry::records() const {
  std::vector<ItemRecord> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) out.push_back(resolve(e));
  return out;
}

std::string GeometryRegistry::idAtIndex(int index) const {
  for (const auto& e : entries_) {
    if (e.record.index == index) return e.record.id;
  }
  return {};
}

ItemRecord GeometryRegistry::resolve(const Entry& e) const {
  if (e.provider) {
    const Rect measured = e.provider();
    if (measured.isValid()) {
      e.record.bounds = measured;
      e.staleLogged = false;
    } else if (!e.staleLogged) {
      std::fprintf(stderr, "GeometryRegistry: '%s' measured invalid bounds, keeping last good\n",
                   e.record.id.c_str());
      e.staleLogged = true;
    }
  }
  return e.record;
}

void GeometryRegistry::rebuildSlots() {
  slots_.clear();
  for (std::size_t i = 0; i < entries_.size(); i++) {
    slots_.emplace(entries_[i].record.id, i);
  }
}

} // namespace dr
