#include "dr/session/DragSession.hpp"
#include "dr/geometry/GeometryRegistry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>
#include <stdexcept>

namespace dr {

DragSession::DragSession(GeometryRegistry& registry, HostScheduler& scheduler)
  : registry_(registry), scheduler_(scheduler) {
  scroller_.setScheduler(&scheduler_);
  scroller_.setDeltaCallback([this](const Position& d) { onScrollDelta(d); });
  applyConfig(config_);
}

DragSession::~DragSession() {
  if (activationTimer_ != kInvalidHandle) {
    scheduler_.cancelTimer(activationTimer_);
    activationTimer_ = kInvalidHandle;
  }
  scroller_.stop();
  detachGlobalInput();
}

void DragSession::setConfig(const DragConfig& cfg) {
  if (state_.phase == DragPhase::Idle) {
    applyConfig(cfg);
    return;
  }
  deferredConfig_ = cfg;
  hasDeferredConfig_ = true;
}

void DragSession::applyConfig(const DragConfig& cfg) {
  config_ = cfg;
  scroller_.setConfig(config_.autoScroll);
  displacer_.setLayout(config_.layout);
}

void DragSession::setGlobalInputSource(GlobalInputSource* source) {
  detachGlobalInput();
  globalInput_ = source;
  if (state_.phase == DragPhase::Active) attachGlobalInput();
}

void DragSession::setViewportSize(double width, double height) {
  scroller_.setViewportSize(width, height);
}

ObserverHandle DragSession::subscribe(StateObserver observer) {
  ObserverHandle h = nextObserver_++;
  observers_.emplace_back(h, std::move(observer));
  return h;
}

void DragSession::unsubscribe(ObserverHandle handle) {
  observers_.erase(
    std::remove_if(observers_.begin(), observers_.end(),
      [&](const std::pair<ObserverHandle, StateObserver>& o) { return o.first == handle; }),
    observers_.end());
}

// -------------------- Input --------------------

bool DragSession::pointerDown(const std::string& id, const PointerEvent& ev) {
  if (id.empty()) {
    throw std::invalid_argument("DragSession::pointerDown: empty item id");
  }
  if (state_.phase != DragPhase::Idle) return false;
  if (!isPrimaryPointer(ev)) return false;

  ItemRecord rec;
  if (!registry_.get(id, rec)) {
    std::fprintf(stderr, "DragSession: pointerDown on unregistered item '%s'\n", id.c_str());
    return false;
  }
  if (rec.disabled) return false;

  generation_++;
  pendingId_ = id;
  state_.phase = DragPhase::Pending;
  state_.initialPosition = ev.position();
  state_.currentPosition = ev.position();

  const std::uint64_t gen = generation_;
  activationTimer_ = scheduler_.scheduleTimer(config_.activation.delayMs, [this, gen] {
    activationTimer_ = kInvalidHandle;
    if (state_.phase == DragPhase::Pending && generation_ == gen) activate();
  });

  publish();
  return true;
}

void DragSession::pointerMove(const PointerEvent& ev) {
  switch (state_.phase) {
    case DragPhase::Pending: {
      state_.currentPosition = ev.position();
      if (distance(ev.position(), state_.initialPosition) >= config_.activation.distancePx) {
        activate();
        if (state_.phase == DragPhase::Active) trackActive(ev.position());
      }
      return;
    }
    case DragPhase::Active:
      trackActive(ev.position());
      return;
    case DragPhase::Idle:
    case DragPhase::Ending:
    default:
      return;
  }
}

void DragSession::pointerUp(const PointerEvent&) {
  if (state_.phase == DragPhase::Pending) {
    dropPending(true);
  } else if (state_.phase == DragPhase::Active) {
    endGesture(false);
  }
}

void DragSession::pointerCancel() {
  cancel();
}

void DragSession::keyDown(KeyCode key) {
  if (key == KeyCode::Escape) cancel();
}

void DragSession::trackLost() {
  cancel();
}

void DragSession::cancel() {
  if (state_.phase == DragPhase::Pending) {
    dropPending(true);
  } else if (state_.phase == DragPhase::Active) {
    endGesture(true);
  }
}

void DragSession::complete() {
  if (state_.phase == DragPhase::Pending) {
    dropPending(true);
  } else if (state_.phase == DragPhase::Active) {
    endGesture(false);
  }
}

bool DragSession::revalidate() {
  if (state_.phase == DragPhase::Pending && !registry_.contains(pendingId_)) {
    dropPending(false);
    return true;
  }
  if (state_.phase == DragPhase::Active && !draggedItemAlive()) {
    forceCancel();
    return true;
  }
  return false;
}

void DragSession::onGlobalPointerMove(const PointerEvent& ev) { pointerMove(ev); }
void DragSession::onGlobalPointerUp(const PointerEvent& ev) { pointerUp(ev); }
void DragSession::onGlobalPointerCancel() { pointerCancel(); }
void DragSession::onGlobalTrackLost() { trackLost(); }
void DragSession::onGlobalKeyDown(KeyCode key) { keyDown(key); }

// -------------------- Transitions --------------------

void DragSession::activate() {
  if (activationTimer_ != kInvalidHandle) {
    scheduler_.cancelTimer(activationTimer_);
    activationTimer_ = kInvalidHandle;
  }

  ItemRecord rec;
  if (!registry_.get(pendingId_, rec) || rec.disabled) {
    std::fprintf(stderr, "DragSession: item '%s' unavailable at activation\n", pendingId_.c_str());
    dropPending(false);
    return;
  }

  const Position start = state_.initialPosition;
  state_.phase = DragPhase::Active;
  state_.draggedId = rec.id;
  state_.originIndex = rec.index;
  state_.overIndex = rec.index;
  state_.currentPosition = start;
  state_.pointerOffsetWithinItem = start - rec.bounds.topLeft();
  state_.accumulatedScrollDelta = {};
  pendingId_.clear();
  stats_.gesturesStarted++;

  scroller_.setProvider(nullptr);
  displacements_ = displacer_.computeAll(state_.draggedId, state_.originIndex,
                                         state_.overIndex, registry_);
  attachGlobalInput();

  pulse(FeedbackKind::Medium);
  if (callbacks_.onDragStart) {
    DragStartEvent ev;
    ev.id = rec.id;
    ev.originIndex = rec.index;
    callbacks_.onDragStart(ev);
  }
  if (state_.phase != DragPhase::Active) return;

  beginScrollResolution(rec);
  if (state_.phase == DragPhase::Active) publish();
}

void DragSession::trackActive(const Position& raw) {
  if (!draggedItemAlive()) {
    forceCancel();
    return;
  }

  const Position pos = applyAxisLock(raw);
  state_.currentPosition = pos;
  stats_.movesProcessed++;

  std::string overItemId;
  const bool overChanged = evaluateTarget(overItemId);

  if (callbacks_.onDragMove) {
    DragMoveEvent ev;
    ev.id = state_.draggedId;
    ev.position = pos;
    ev.deltaFromStart = pos - state_.initialPosition;
    callbacks_.onDragMove(ev);
    if (state_.phase != DragPhase::Active) return;
  }

  if (overChanged) {
    emitOver(overItemId);
    if (state_.phase != DragPhase::Active) return;
  }
  publish();
}

bool DragSession::evaluateTarget(std::string& overItemId) {
  if (!geometryReady_) return false;

  scroller_.update(state_.currentPosition);

  const HitResult hit = hitTester_.locate(state_.currentPosition, registry_, state_.draggedId);
  int next = state_.overIndex;
  if (hit.hit) {
    next = hit.index;
    overItemId = hit.id;
  } else {
    // Gaps between items keep the previous target.
    stats_.hitTestMisses++;
  }

  const bool changed = next != state_.overIndex;
  state_.overIndex = next;
  if (changed) stats_.overChanges++;

  displacements_ = displacer_.computeAll(state_.draggedId, state_.originIndex,
                                         state_.overIndex, registry_);
  return changed;
}

void DragSession::endGesture(bool cancelled) {
  if (state_.phase != DragPhase::Active) return;
  state_.phase = DragPhase::Ending;

  scroller_.stop();
  scroller_.setProvider(nullptr);
  detachGlobalInput();

  if (!cancelled && !draggedItemAlive()) {
    std::fprintf(stderr, "DragSession: dragged item '%s' is gone; cancelling\n",
                 state_.draggedId.c_str());
    stats_.forcedCancels++;
    cancelled = true;
  }

  DragEndEvent ev;
  ev.id = state_.draggedId;
  ev.fromIndex = state_.originIndex;
  ev.toIndex = cancelled ? state_.originIndex : state_.overIndex;
  ev.cancelled = cancelled;

  if (cancelled) stats_.gesturesCancelled++;
  else stats_.gesturesCommitted++;

  pulse(FeedbackKind::Medium);
  if (callbacks_.onDragEnd) callbacks_.onDragEnd(ev);

  resetToIdle();
  publish();
}

void DragSession::forceCancel() {
  std::fprintf(stderr, "DragSession: dragged item '%s' is gone; cancelling\n",
               state_.draggedId.c_str());
  stats_.forcedCancels++;
  endGesture(true);
}

void DragSession::dropPending(bool tap) {
  if (state_.phase != DragPhase::Pending) return;
  if (tap) stats_.taps++;
  resetToIdle();
  publish();
}

void DragSession::resetToIdle() {
  if (activationTimer_ != kInvalidHandle) {
    scheduler_.cancelTimer(activationTimer_);
    activationTimer_ = kInvalidHandle;
  }
  state_ = DragSessionState{};
  pendingId_.clear();
  displacements_.clear();
  geometryReady_ = false;
  generation_++;

  if (hasDeferredConfig_) {
    hasDeferredConfig_ = false;
    applyConfig(deferredConfig_);
  }
}

// -------------------- Auto-scroll --------------------

void DragSession::beginScrollResolution(const ItemRecord& item) {
  geometryReady_ = false;
  if (!resolver_ || !config_.autoScroll.enabled) {
    geometryReady_ = true;
    return;
  }

  const std::uint64_t gen = generation_;
  std::weak_ptr<int> life = lifeToken_;
  resolver_->resolve(item, [this, gen, life](std::shared_ptr<ScrollProvider> provider) {
    if (life.expired()) return;
    onScrollResolved(gen, std::move(provider));
  });
}

void DragSession::onScrollResolved(std::uint64_t generation,
                                   std::shared_ptr<ScrollProvider> provider) {
  if (generation != generation_ || state_.phase != DragPhase::Active || geometryReady_) return;

  if (provider) {
    scroller_.setProvider(std::move(provider));
  } else {
    std::fprintf(stderr, "DragSession: scroll container not resolved; auto-scroll off for '%s'\n",
                 state_.draggedId.c_str());
  }
  geometryReady_ = true;

  if (!draggedItemAlive()) {
    forceCancel();
    return;
  }

  // Moves that arrived while resolving only updated the position.
  std::string overItemId;
  if (evaluateTarget(overItemId)) {
    emitOver(overItemId);
    if (state_.phase != DragPhase::Active) return;
  }
  publish();
}

void DragSession::onScrollDelta(const Position& delta) {
  if (state_.phase != DragPhase::Active) return;
  if (!draggedItemAlive()) {
    forceCancel();
    return;
  }

  state_.accumulatedScrollDelta = state_.accumulatedScrollDelta + delta;
  stats_.scrollFrames++;
  stats_.scrolledDistancePx += std::fabs(delta.x) + std::fabs(delta.y);
  publish();
}

// -------------------- Helpers --------------------

void DragSession::attachGlobalInput() {
  if (globalInput_ && globalSub_ == 0) globalSub_ = globalInput_->subscribe(this);
}

void DragSession::detachGlobalInput() {
  if (globalInput_ && globalSub_ != 0) globalInput_->unsubscribe(globalSub_);
  globalSub_ = 0;
}

bool DragSession::draggedItemAlive() const {
  return !state_.draggedId.empty() && registry_.contains(state_.draggedId);
}

Position DragSession::applyAxisLock(const Position& p) const {
  Position out = p;
  if (config_.lockAxis == LockAxis::X) out.x = state_.initialPosition.x;
  else if (config_.lockAxis == LockAxis::Y) out.y = state_.initialPosition.y;
  return out;
}

void DragSession::emitOver(const std::string& overItemId) {
  pulse(FeedbackKind::Light);
  if (!callbacks_.onDragOver) return;
  DragOverEvent ev;
  ev.id = state_.draggedId;
  ev.overIndex = state_.overIndex;
  ev.hasOverItem = !overItemId.empty();
  ev.overItemId = overItemId;
  callbacks_.onDragOver(ev);
}

void DragSession::pulse(FeedbackKind kind) {
  if (!config_.hapticFeedback || !feedback_) return;
  try {
    feedback_->pulse(kind);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "DragSession: feedback pulse failed: %s\n", e.what());
  }
}

void DragSession::publish() {
  // Observers may unsubscribe while being notified.
  auto snapshot = observers_;
  for (auto& o : snapshot) {
    if (o.second) o.second(state_);
  }
}

} // namespace dr
