#pragma once
#include "dr/config/DragConfig.hpp"
#include "dr/debug/Stats.hpp"
#include "dr/displacement/Displacement.hpp"
#include "dr/geometry/HitTester.hpp"
#include "dr/host/FeedbackSink.hpp"
#include "dr/host/GlobalInputSource.hpp"
#include "dr/host/HostScheduler.hpp"
#include "dr/host/ScrollProvider.hpp"
#include "dr/input/InputEvents.hpp"
#include "dr/scroll/AutoScroller.hpp"
#include "dr/session/DragEvents.hpp"
#include "dr/session/DragState.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace dr {

class GeometryRegistry;

using ObserverHandle = std::uint32_t;
using StateObserver = std::function<void(const DragSessionState&)>;

// Drag gesture state machine: Idle -> Pending -> Active -> Ending -> Idle.
//
// One gesture at a time. Within a pointer move the order is fixed:
// position update, auto-scroll evaluation, hit test, displacement.
// Every terminal path (up, cancel, escape, track loss, programmatic) stops
// the scroll loop and resets the state in one step.
class DragSession : public GlobalInputListener {
public:
  DragSession(GeometryRegistry& registry, HostScheduler& scheduler);
  ~DragSession() override;

  DragSession(const DragSession&) = delete;
  DragSession& operator=(const DragSession&) = delete;

  // Applied immediately when Idle, otherwise once the gesture ends.
  void setConfig(const DragConfig& cfg);
  const DragConfig& config() const { return config_; }

  // Optional host capabilities (not owned). nullptr disables each.
  void setScrollResolver(ScrollResolver* resolver) { resolver_ = resolver; }
  void setFeedbackSink(FeedbackSink* sink) { feedback_ = sink; }
  void setGlobalInputSource(GlobalInputSource* source);

  void setViewportSize(double width, double height);
  void setCallbacks(DragCallbacks callbacks) { callbacks_ = std::move(callbacks); }

  // Snapshot observers, called after every transition.
  ObserverHandle subscribe(StateObserver observer);
  void unsubscribe(ObserverHandle handle);

  // ---- Item-level input ----

  // Returns true when the press started a Pending gesture. Ignored while a
  // gesture is in progress, for non-primary pointers, and for unknown or
  // disabled items. Throws std::invalid_argument on an empty id.
  bool pointerDown(const std::string& id, const PointerEvent& ev);
  void pointerMove(const PointerEvent& ev);
  void pointerUp(const PointerEvent& ev);
  void pointerCancel();
  void keyDown(KeyCode key);
  void trackLost();

  // Programmatic end. A Pending gesture is dropped without notification.
  void cancel();
  void complete();

  // Cancels when the dragged item is no longer registered. Returns true if it did.
  bool revalidate();

  // ---- GlobalInputListener (subscribed only while Active) ----
  void onGlobalPointerMove(const PointerEvent& ev) override;
  void onGlobalPointerUp(const PointerEvent& ev) override;
  void onGlobalPointerCancel() override;
  void onGlobalTrackLost() override;
  void onGlobalKeyDown(KeyCode key) override;

  // ---- Queries ----
  const DragSessionState& state() const { return state_; }
  DragPhase phase() const { return state_.phase; }
  bool isDragging() const { return state_.isDragging(); }
  const std::string& draggedId() const { return state_.draggedId; }
  int overIndex() const { return state_.overIndex; }

  // False between activation and scroll-container resolution.
  bool geometryReady() const { return geometryReady_; }

  const std::vector<ItemDisplacement>& displacements() const { return displacements_; }
  const DragStats& stats() const { return stats_; }
  const AutoScroller& autoScroller() const { return scroller_; }

private:
  void applyConfig(const DragConfig& cfg);

  void activate();
  void trackActive(const Position& raw);
  bool evaluateTarget(std::string& overItemId);
  void endGesture(bool cancelled);
  void forceCancel();
  void dropPending(bool tap);
  void resetToIdle();

  void beginScrollResolution(const ItemRecord& item);
  void onScrollResolved(std::uint64_t generation, std::shared_ptr<ScrollProvider> provider);
  void onScrollDelta(const Position& delta);

  void attachGlobalInput();
  void detachGlobalInput();

  bool draggedItemAlive() const;
  Position applyAxisLock(const Position& p) const;
  void emitOver(const std::string& overItemId);
  void pulse(FeedbackKind kind);
  void publish();

  GeometryRegistry& registry_;
  HostScheduler& scheduler_;

  DragConfig config_;
  DragConfig deferredConfig_;
  bool hasDeferredConfig_{false};

  ScrollResolver* resolver_{nullptr};
  FeedbackSink* feedback_{nullptr};
  GlobalInputSource* globalInput_{nullptr};
  InputSubscription globalSub_{0};

  HitTester hitTester_;
  AutoScroller scroller_;
  DisplacementCalculator displacer_;

  DragCallbacks callbacks_;
  std::vector<std::pair<ObserverHandle, StateObserver>> observers_;
  ObserverHandle nextObserver_{1};

  DragSessionState state_;
  std::vector<ItemDisplacement> displacements_;
  DragStats stats_;

  // Pending bookkeeping
  std::string pendingId_;
  TimerHandle activationTimer_{kInvalidHandle};

  // Bumped per gesture; stale timers and resolutions compare against it.
  std::uint64_t generation_{0};
  bool geometryReady_{false};

  // Expires with the session so late resolver callbacks become no-ops.
  std::shared_ptr<int> lifeToken_{std::make_shared<int>(0)};
};

} // namespace dr
