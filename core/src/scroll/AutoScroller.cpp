#include "dr/scroll/AutoScroller.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace dr {

double edgeScrollSpeed(double distancePx, const AutoScrollConfig& cfg) {
  if (!std::isfinite(distancePx)) return 0.0;
  if (cfg.thresholdPx <= 0.0 || distancePx >= cfg.thresholdPx) return 0.0;

  double intensity = distancePx <= 0.0 ? 1.0 : 1.0 - distancePx / cfg.thresholdPx;
  intensity = std::min(1.0, std::max(0.1, intensity));

  return std::min(cfg.maxSpeedPxPerFrame,
                  intensity * cfg.maxSpeedPxPerFrame * cfg.acceleration);
}

AutoScroller::~AutoScroller() {
  stop();
}

void AutoScroller::setScheduler(HostScheduler* scheduler) {
  stop();
  scheduler_ = scheduler;
}

void AutoScroller::setViewportSize(double width, double height) {
  viewportW_ = width;
  viewportH_ = height;
}

void AutoScroller::setProvider(std::shared_ptr<ScrollProvider> provider) {
  if (!provider) stop();
  provider_ = std::move(provider);
}

Position AutoScroller::computeVelocity(const Position& pointer) const {
  Position v;
  if (!config_.enabled || !provider_) return v;

  const ScrollMetrics m = provider_->metrics();

  // Visible part of the container, clamped to the window.
  double visibleTop = m.visibleBounds.top;
  double visibleBottom = m.visibleBounds.bottom;
  double visibleLeft = m.visibleBounds.left;
  double visibleRight = m.visibleBounds.right;
  if (viewportH_ > 0.0) {
    visibleTop = std::max(0.0, visibleTop);
    visibleBottom = std::min(viewportH_, visibleBottom);
  }
  if (viewportW_ > 0.0) {
    visibleLeft = std::max(0.0, visibleLeft);
    visibleRight = std::min(viewportW_, visibleRight);
  }

  const bool canScrollUp = m.offset.y > 0.0;
  const bool canScrollDown = m.offset.y < m.maxOffset.y;
  const bool canScrollLeft = m.offset.x > 0.0;
  const bool canScrollRight = m.offset.x < m.maxOffset.x;

  // Opposing edges: the later check wins.
  if (canScrollUp) {
    double s = edgeScrollSpeed(pointer.y - visibleTop, config_);
    if (s > 0.0) v.y = -s;
  }
  if (canScrollDown) {
    double s = edgeScrollSpeed(visibleBottom - pointer.y, config_);
    if (s > 0.0) v.y = s;
  }
  if (canScrollLeft) {
    double s = edgeScrollSpeed(pointer.x - visibleLeft, config_);
    if (s > 0.0) v.x = -s;
  }
  if (canScrollRight) {
    double s = edgeScrollSpeed(visibleRight - pointer.x, config_);
    if (s > 0.0) v.x = s;
  }

  return v;
}

void AutoScroller::update(const Position& pointer) {
  lastPointer_ = pointer;
  if (!config_.enabled) return;

  velocity_ = computeVelocity(pointer);
  if (isZero(velocity_)) {
    stop();
    return;
  }

  state_ = AutoScrollState::Scrolling;
  if (frame_ == kInvalidHandle) requestNextFrame();
}

void AutoScroller::stop() {
  state_ = AutoScrollState::Idle;
  velocity_ = {};
  if (frame_ != kInvalidHandle && scheduler_) {
    scheduler_->cancelFrame(frame_);
  }
  frame_ = kInvalidHandle;
}

void AutoScroller::requestNextFrame() {
  if (!scheduler_) return;
  frame_ = scheduler_->requestFrame([this] { onFrame(); });
}

void AutoScroller::onFrame() {
  frame_ = kInvalidHandle;
  if (state_ != AutoScrollState::Scrolling || !provider_) {
    stop();
    return;
  }

  velocity_ = computeVelocity(lastPointer_);
  if (isZero(velocity_)) {
    stop();
    return;
  }

  framesRun_++;
  const Position actual = provider_->scrollBy(velocity_);

  // Re-arm before reporting: the callback may stop us.
  requestNextFrame();
  if (!isZero(actual) && onDelta_) onDelta_(actual);
}

} // namespace dr
