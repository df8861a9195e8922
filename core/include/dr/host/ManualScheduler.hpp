#pragma once
#include "dr/host/HostScheduler.hpp"

#include <cstddef>
#include <functional>
#include <unordered_set>
#include <vector>

namespace dr {

// Deterministic scheduler driven by the caller: time only moves in
// advance(), frames only run in runFrame(). Used by tests and replay.
class ManualScheduler : public HostScheduler {
public:
  TimerHandle scheduleTimer(double delayMs, std::function<void()> fn) override;
  void cancelTimer(TimerHandle handle) override;
  TimerHandle requestFrame(std::function<void()> fn) override;
  void cancelFrame(TimerHandle handle) override;

  // Move the clock forward, firing due timers in deadline order.
  void advance(double ms);

  // Run the callbacks requested before this call. Returns how many ran.
  std::size_t runFrame();
  std::size_t runFrames(std::size_t count);

  double now() const { return now_; }
  std::size_t pendingTimers() const { return timers_.size(); }
  std::size_t pendingFrames() const { return frames_.size(); }

private:
  struct Timer {
    TimerHandle handle;
    double dueMs;
    std::function<void()> fn;
  };
  struct Frame {
    TimerHandle handle;
    std::function<void()> fn;
  };

  double now_{0};
  TimerHandle next_{1};
  std::vector<Timer> timers_;
  std::vector<Frame> frames_;
  std::unordered_set<TimerHandle> cancelledInFlight_;
};

} // namespace dr
