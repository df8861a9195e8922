// D3.2: Auto-scroll frame loop test (pure C++)
// Tests: loop start/stop, stop at scroll extreme, reported deltas,
// explicit stop cancels the pending frame.

#include "dr/host/ManualScheduler.hpp"
#include "dr/scroll/AutoScroller.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

class ListScroll : public dr::ScrollProvider {
public:
  double offsetY{0};
  double maxY{100};
  int calls{0};

  dr::ScrollMetrics metrics() const override {
    dr::ScrollMetrics m;
    m.visibleBounds = dr::Rect{0, 0, 300, 400};
    m.offset = {0, offsetY};
    m.maxOffset = {0, maxY};
    return m;
  }

  dr::Position scrollBy(const dr::Position& d) override {
    calls++;
    const double before = offsetY;
    offsetY = std::min(maxY, std::max(0.0, offsetY + d.y));
    return {0, offsetY - before};
  }
};

int main() {
  // --- Test 1: loop runs until the bottom is reached, then stops ---
  {
    dr::ManualScheduler sched;
    auto list = std::make_shared<ListScroll>();
    dr::AutoScroller as;
    as.setScheduler(&sched);
    as.setProvider(list);

    std::vector<double> deltas;
    as.setDeltaCallback([&](const dr::Position& d) { deltas.push_back(d.y); });

    as.update({150, 395});
    requireTrue(as.state() == dr::AutoScrollState::Scrolling, "scrolling after update");
    requireTrue(sched.pendingFrames() == 1, "one frame requested");
    requireTrue(deltas.empty(), "no scroll before the first frame");

    // 15px/frame: 6 full frames, a clamped 10px frame, then a frame that stops.
    requireTrue(sched.runFrames(20) == 8, "eight frames ran");
    requireTrue(list->offsetY == 100, "reached bottom");
    requireTrue(as.state() == dr::AutoScrollState::Idle, "idle at extreme");
    requireTrue(sched.pendingFrames() == 0, "loop stopped");
    requireTrue(as.framesRun() == 7, "seven scrolling frames");

    requireTrue(deltas.size() == 7, "seven reported deltas");
    requireTrue(deltas.back() == 10, "last delta clamped");
    double sum = 0;
    for (double d : deltas) sum += d;
    requireTrue(sum == 100, "deltas sum to distance scrolled");
    std::printf("  Test 1 (run to extreme) PASS\n");
  }

  // --- Test 2: moving out of the edge zone stops the loop ---
  {
    dr::ManualScheduler sched;
    auto list = std::make_shared<ListScroll>();
    list->maxY = 1000;
    dr::AutoScroller as;
    as.setScheduler(&sched);
    as.setProvider(list);

    as.update({150, 395});
    sched.runFrames(2);
    requireTrue(list->calls == 2, "two frames scrolled");

    as.update({150, 200});
    requireTrue(as.state() == dr::AutoScrollState::Idle, "idle out of zone");
    requireTrue(sched.pendingFrames() == 0, "pending frame cancelled");
    sched.runFrames(3);
    requireTrue(list->calls == 2, "no more scrolling");
    std::printf("  Test 2 (leave edge) PASS\n");
  }

  // --- Test 3: stop() and detach ---
  {
    dr::ManualScheduler sched;
    auto list = std::make_shared<ListScroll>();
    list->maxY = 1000;
    dr::AutoScroller as;
    as.setScheduler(&sched);
    as.setProvider(list);

    as.update({150, 395});
    as.stop();
    requireTrue(sched.pendingFrames() == 0, "stop cancels frame");
    requireTrue(dr::isZero(as.velocity()), "velocity zeroed");

    as.update({150, 395});
    requireTrue(sched.pendingFrames() == 1, "restart");
    as.setProvider(nullptr);
    requireTrue(sched.pendingFrames() == 0, "detach stops");
    requireTrue(!as.hasProvider(), "provider cleared");
    std::printf("  Test 3 (stop/detach) PASS\n");
  }

  // --- Test 4: callback stopping the loop leaves nothing scheduled ---
  {
    dr::ManualScheduler sched;
    auto list = std::make_shared<ListScroll>();
    list->maxY = 1000;
    dr::AutoScroller as;
    as.setScheduler(&sched);
    as.setProvider(list);
    as.setDeltaCallback([&](const dr::Position&) { as.stop(); });

    as.update({150, 395});
    sched.runFrame();
    requireTrue(list->calls == 1, "one scroll");
    requireTrue(sched.pendingFrames() == 0, "re-armed frame cancelled by callback");
    std::printf("  Test 4 (stop from callback) PASS\n");
  }

  std::printf("D3.2 auto-scroll loop: ALL PASS\n");
  return 0;
}
