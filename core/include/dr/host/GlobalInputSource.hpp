#pragma once
#include "dr/input/InputEvents.hpp"

#include <cstdint>

namespace dr {

// Window-level input, delivered regardless of which item is under the pointer.
class GlobalInputListener {
public:
  virtual ~GlobalInputListener() = default;
  virtual void onGlobalPointerMove(const PointerEvent& ev) = 0;
  virtual void onGlobalPointerUp(const PointerEvent& ev) = 0;
  virtual void onGlobalPointerCancel() = 0;
  virtual void onGlobalTrackLost() = 0;
  virtual void onGlobalKeyDown(KeyCode key) = 0;
};

using InputSubscription = std::uint64_t;

class GlobalInputSource {
public:
  virtual ~GlobalInputSource() = default;
  virtual InputSubscription subscribe(GlobalInputListener* listener) = 0;
  virtual void unsubscribe(InputSubscription token) = 0;
};

} // namespace dr
