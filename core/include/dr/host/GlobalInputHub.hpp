#pragma once
#include "dr/host/GlobalInputSource.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace dr {

// Fan-out GlobalInputSource for hosts that receive raw window events in one
// place and forward them here.
class GlobalInputHub : public GlobalInputSource {
public:
  InputSubscription subscribe(GlobalInputListener* listener) override;
  void unsubscribe(InputSubscription token) override;

  void dispatchPointerMove(const PointerEvent& ev);
  void dispatchPointerUp(const PointerEvent& ev);
  void dispatchPointerCancel();
  void dispatchTrackLost();
  void dispatchKeyDown(KeyCode key);

  std::size_t listenerCount() const { return listeners_.size(); }

private:
  template <typename Fn>
  void forEach(Fn&& fn);

  InputSubscription next_{1};
  std::vector<std::pair<InputSubscription, GlobalInputListener*>> listeners_;
};

} // namespace dr
