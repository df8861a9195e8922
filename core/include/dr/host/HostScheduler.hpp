#pragma once
#include <cstdint>
#include <functional>

namespace dr {

using TimerHandle = std::uint64_t;

inline constexpr TimerHandle kInvalidHandle = 0;

// Host event-loop services. Callbacks run on the same logical thread as
// pointer input; the engine never blocks on them.
class HostScheduler {
public:
  virtual ~HostScheduler() = default;

  // One-shot timer.
  virtual TimerHandle scheduleTimer(double delayMs, std::function<void()> fn) = 0;
  virtual void cancelTimer(TimerHandle handle) = 0;

  // One-shot callback on the next display frame (re-request to loop).
  virtual TimerHandle requestFrame(std::function<void()> fn) = 0;
  virtual void cancelFrame(TimerHandle handle) = 0;
};

} // namespace dr
