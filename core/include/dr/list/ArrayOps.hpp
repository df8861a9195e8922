#pragma once
#include <cstddef>
#include <vector>

namespace dr {

// Helpers for applying a drag-end {fromIndex, toIndex} to a caller's list.
// They return a new vector; out-of-range sources leave the list unchanged and
// destination indices are clamped into range.

template <typename T>
std::vector<T> arrayMove(const std::vector<T>& items, int from, int to) {
  std::vector<T> out = items;
  if (from < 0 || static_cast<std::size_t>(from) >= out.size()) return out;
  if (to < 0) to = 0;
  if (static_cast<std::size_t>(to) >= out.size()) to = static_cast<int>(out.size()) - 1;
  if (from == to) return out;

  T moved = out[static_cast<std::size_t>(from)];
  out.erase(out.begin() + from);
  out.insert(out.begin() + to, moved);
  return out;
}

template <typename T>
std::vector<T> arrayInsert(const std::vector<T>& items, int index, const T& value) {
  std::vector<T> out = items;
  if (index < 0) index = 0;
  if (static_cast<std::size_t>(index) > out.size()) index = static_cast<int>(out.size());
  out.insert(out.begin() + index, value);
  return out;
}

template <typename T>
std::vector<T> arrayRemove(const std::vector<T>& items, int index) {
  std::vector<T> out = items;
  if (index < 0 || static_cast<std::size_t>(index) >= out.size()) return out;
  out.erase(out.begin() + index);
  return out;
}

} // namespace dr
