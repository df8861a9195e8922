#include "dr/host/ManualScheduler.hpp"

#include <algorithm>
#include <utility>

namespace dr {

TimerHandle ManualScheduler::scheduleTimer(double delayMs, std::function<void()> fn) {
  TimerHandle h = next_++;
  timers_.push_back({h, now_ + std::max(0.0, delayMs), std::move(fn)});
  return h;
}

void ManualScheduler::cancelTimer(TimerHandle handle) {
  timers_.erase(
    std::remove_if(timers_.begin(), timers_.end(),
      [&](const Timer& t) { return t.handle == handle; }),
    timers_.end());
}

TimerHandle ManualScheduler::requestFrame(std::function<void()> fn) {
  TimerHandle h = next_++;
  frames_.push_back({h, std::move(fn)});
  return h;
}

void ManualScheduler::cancelFrame(TimerHandle handle) {
  auto before = frames_.size();
  frames_.erase(
    std::remove_if(frames_.begin(), frames_.end(),
      [&](const Frame& f) { return f.handle == handle; }),
    frames_.end());
  if (frames_.size() == before) cancelledInFlight_.insert(handle);
}

void ManualScheduler::advance(double ms) {
  const double target = now_ + std::max(0.0, ms);
  for (;;) {
    auto due = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (it->dueMs > target) continue;
      if (due == timers_.end() || it->dueMs < due->dueMs) due = it;
    }
    if (due == timers_.end()) break;

    Timer t = std::move(*due);
    timers_.erase(due);
    now_ = t.dueMs;
    if (t.fn) t.fn();
  }
  now_ = target;
}

std::size_t ManualScheduler::runFrame() {
  std::vector<Frame> batch;
  batch.swap(frames_);
  cancelledInFlight_.clear();

  std::size_t ran = 0;
  for (auto& f : batch) {
    if (cancelledInFlight_.count(f.handle)) continue;
    if (f.fn) {
      f.fn();
      ran++;
    }
  }
  cancelledInFlight_.clear();
  return ran;
}

std::size_t ManualScheduler::runFrames(std::size_t count) {
  std::size_t ran = 0;
  for (std::size_t i = 0; i < count; i++) ran += runFrame();
  return ran;
}

} // namespace dr
