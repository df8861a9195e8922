#pragma once
#include "dr/geometry/Types.hpp"
#include "dr/host/HostScheduler.hpp"
#include "dr/host/ScrollProvider.hpp"

#include <cstdint>
#include <functional>
#include <memory>

namespace dr {

struct AutoScrollConfig {
  bool enabled{true};
  double thresholdPx{80.0};          // distance from edge where scrolling starts
  double maxSpeedPxPerFrame{15.0};
  double acceleration{1.5};
};

enum class AutoScrollState : std::uint8_t { Idle = 0, Scrolling };

// Speed magnitude for a pointer `distancePx` inside an edge.
// 0 at or beyond the threshold; intensity floors at 0.1 so the speed never
// fades to nothing just inside it; distance <= 0 is full intensity.
double edgeScrollSpeed(double distancePx, const AutoScrollConfig& cfg);

// Edge-proximity auto-scroll. Velocity is evaluated on each pointer update
// and again on each frame, so reaching a scroll extreme stops the loop.
class AutoScroller {
public:
  using DeltaCallback = std::function<void(const Position& actualDelta)>;

  AutoScroller() = default;
  ~AutoScroller();
  AutoScroller(const AutoScroller&) = delete;
  AutoScroller& operator=(const AutoScroller&) = delete;

  void setConfig(const AutoScrollConfig& cfg) { config_ = cfg; }
  const AutoScrollConfig& config() const { return config_; }
  void setScheduler(HostScheduler* scheduler);

  // Window size used to clamp the container's visible edges. <= 0 disables clamping.
  void setViewportSize(double width, double height);

  // nullptr detaches (and stops).
  void setProvider(std::shared_ptr<ScrollProvider> provider);
  bool hasProvider() const { return provider_ != nullptr; }

  // Invoked with the delta actually achieved, only when non-zero.
  void setDeltaCallback(DeltaCallback cb) { onDelta_ = std::move(cb); }

  // Signed px/frame for a pointer position. Zero without a provider.
  Position computeVelocity(const Position& pointer) const;

  // Feed the latest pointer position; starts or stops the frame loop.
  void update(const Position& pointer);

  // Halt the loop and zero velocity.
  void stop();

  AutoScrollState state() const { return state_; }
  Position velocity() const { return velocity_; }
  std::uint64_t framesRun() const { return framesRun_; }

private:
  void onFrame();
  void requestNextFrame();

  AutoScrollConfig config_;
  HostScheduler* scheduler_{nullptr};
  std::shared_ptr<ScrollProvider> provider_;
  DeltaCallback onDelta_;

  double viewportW_{0};
  double viewportH_{0};

  AutoScrollState state_{AutoScrollState::Idle};
  Position velocity_;
  Position lastPointer_;
  TimerHandle frame_{kInvalidHandle};
  std::uint64_t framesRun_{0};
};

} // namespace dr
