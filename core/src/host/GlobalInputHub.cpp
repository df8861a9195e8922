#include "dr/host/GlobalInputHub.hpp"

#include <algorithm>

namespace dr {

InputSubscription GlobalInputHub::subscribe(GlobalInputListener* listener) {
  if (!listener) return 0;
  InputSubscription token = next_++;
  listeners_.emplace_back(token, listener);
  return token;
}

void GlobalInputHub::unsubscribe(InputSubscription token) {
  listeners_.erase(
    std::remove_if(listeners_.begin(), listeners_.end(),
      [&](const std::pair<InputSubscription, GlobalInputListener*>& l) {
        return l.first == token;
      }),
    listeners_.end());
}

template <typename Fn>
void GlobalInputHub::forEach(Fn&& fn) {
  // Listeners may unsubscribe while being notified.
  auto snapshot = listeners_;
  for (auto& l : snapshot) {
    bool live = std::any_of(listeners_.begin(), listeners_.end(),
      [&](const std::pair<InputSubscription, GlobalInputListener*>& cur) {
        return cur.first == l.first;
      });
    if (live) fn(*l.second);
  }
}

void GlobalInputHub::dispatchPointerMove(const PointerEvent& ev) {
  forEach([&](GlobalInputListener& l) { l.onGlobalPointerMove(ev); });
}

void GlobalInputHub::dispatchPointerUp(const PointerEvent& ev) {
  forEach([&](GlobalInputListener& l) { l.onGlobalPointerUp(ev); });
}

void GlobalInputHub::dispatchPointerCancel() {
  forEach([](GlobalInputListener& l) { l.onGlobalPointerCancel(); });
}

void GlobalInputHub::dispatchTrackLost() {
  forEach([](GlobalInputListener& l) { l.onGlobalTrackLost(); });
}

void GlobalInputHub::dispatchKeyDown(KeyCode key) {
  forEach([&](GlobalInputListener& l) { l.onGlobalKeyDown(key); });
}

} // namespace dr
