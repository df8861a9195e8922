// D6.1: Reorder replay demo (headless)
// Replays a JSON gesture script against a scrollable list and prints every
// drag event plus the resulting order.
//
//   d6_1_reorder_replay [script.json]
//
// Script: {"config":{...}, "commands":[{"cmd":...}, ...]}
// Without a script a built-in gesture drags "item-0" past the bottom edge.

#include "dr/commands/DragCommandProcessor.hpp"
#include "dr/config/DragConfig.hpp"
#include "dr/geometry/GeometryRegistry.hpp"
#include "dr/host/ManualScheduler.hpp"
#include "dr/list/ArrayOps.hpp"
#include "dr/session/DragSession.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// ---- A vertical list inside a 400px tall container ----

static constexpr double kRowHeight = 40.0;
static constexpr double kGap = 16.0;
static constexpr double kViewW = 320.0;
static constexpr double kViewH = 400.0;

class ListContainer : public dr::ScrollProvider {
public:
  explicit ListContainer(int rows) : rows_(rows) {}

  dr::ScrollMetrics metrics() const override {
    dr::ScrollMetrics m;
    m.visibleBounds = {0, 0, kViewW, kViewH};
    m.offset = {0, offsetY_};
    m.maxOffset = {0, maxOffset()};
    return m;
  }

  dr::Position scrollBy(const dr::Position& delta) override {
    const double before = offsetY_;
    offsetY_ = std::min(maxOffset(), std::max(0.0, offsetY_ + delta.y));
    return {0, offsetY_ - before};
  }

  dr::Rect rowBounds(int row) const {
    const double top = row * (kRowHeight + kGap) - offsetY_;
    return {0, top, kViewW, top + kRowHeight};
  }

private:
  double maxOffset() const {
    const double content = rows_ * (kRowHeight + kGap);
    return std::max(0.0, content - kViewH);
  }

  int rows_;
  double offsetY_{0};
};

// Resolves on the next scheduler tick, as a host walking its view tree would.
class DeferredResolver : public dr::ScrollResolver {
public:
  DeferredResolver(dr::HostScheduler& sched, std::shared_ptr<ListContainer> list)
    : sched_(sched), list_(std::move(list)) {}

  void resolve(const dr::ItemRecord&, dr::ScrollResolveCallback done) override {
    auto list = list_;
    sched_.scheduleTimer(0, [done, list] { done(list); });
  }

private:
  dr::HostScheduler& sched_;
  std::shared_ptr<ListContainer> list_;
};

class PrintFeedback : public dr::FeedbackSink {
public:
  void pulse(dr::FeedbackKind kind) override {
    std::printf("  [feedback] %s\n", dr::toString(kind));
  }
};

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path);
  if (!in) return false;
  std::stringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

static const char* kBuiltinScript = R"({
  "config": {"activationDelay": 150, "activationDistance": 5,
             "autoScroll": {"threshold": 80, "maxSpeed": 15}},
  "commands": [
    {"cmd": "pointerDown", "id": "item-0", "x": 100, "y": 20},
    {"cmd": "advance", "ms": 160},
    {"cmd": "pointerMove", "x": 100, "y": 120},
    {"cmd": "pointerMove", "x": 100, "y": 250},
    {"cmd": "pointerMove", "x": 100, "y": 380},
    {"cmd": "frame", "count": 12},
    {"cmd": "pointerMove", "x": 100, "y": 300},
    {"cmd": "state"},
    {"cmd": "pointerUp"}
  ]
})";

int main(int argc, char** argv) {
  std::string script = kBuiltinScript;
  if (argc > 1 && !readFile(argv[1], script)) {
    std::fprintf(stderr, "reorder_replay: cannot read '%s'\n", argv[1]);
    return 1;
  }

  rapidjson::Document doc;
  doc.Parse(script.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "reorder_replay: script is not a JSON object\n");
    return 1;
  }

  const int rows = 12;
  auto list = std::make_shared<ListContainer>(rows);

  dr::ManualScheduler sched;
  dr::GeometryRegistry registry;
  dr::DragSession session(registry, sched);
  DeferredResolver resolver(sched, list);
  PrintFeedback feedback;

  std::vector<std::string> order;
  for (int i = 0; i < rows; i++) {
    const std::string id = "item-" + std::to_string(i);
    order.push_back(id);
    ListContainer* raw = list.get();
    registry.registerItem(id, i, [raw, i] { return raw->rowBounds(i); });
  }

  dr::DragConfig cfg;
  cfg.layout.gapPx = kGap;
  if (doc.HasMember("config") && !dr::parseDragConfig(doc["config"], cfg)) {
    std::fprintf(stderr, "reorder_replay: invalid config block\n");
    return 1;
  }
  session.setConfig(cfg);
  session.setViewportSize(kViewW, kViewH);
  session.setScrollResolver(&resolver);
  session.setFeedbackSink(&feedback);

  dr::DragCallbacks cb;
  cb.onDragStart = [](const dr::DragStartEvent& e) {
    std::printf("  dragStart  id=%s origin=%d\n", e.id.c_str(), e.originIndex);
  };
  cb.onDragOver = [](const dr::DragOverEvent& e) {
    std::printf("  dragOver   id=%s over=%d (%s)\n", e.id.c_str(), e.overIndex,
                e.hasOverItem ? e.overItemId.c_str() : "-");
  };
  cb.onDragEnd = [&order](const dr::DragEndEvent& e) {
    std::printf("  dragEnd    id=%s from=%d to=%d cancelled=%s\n", e.id.c_str(),
                e.fromIndex, e.toIndex, e.cancelled ? "true" : "false");
    if (!e.cancelled) order = dr::arrayMove(order, e.fromIndex, e.toIndex);
  };
  session.setCallbacks(cb);

  dr::DragCommandProcessor proc(session, registry, &sched);

  if (!doc.HasMember("commands") || !doc["commands"].IsArray()) {
    std::fprintf(stderr, "reorder_replay: missing commands array\n");
    return 1;
  }

  int failures = 0;
  for (const auto& c : doc["commands"].GetArray()) {
    rapidjson::StringBuffer sb;
    rapidjson::Writer<rapidjson::StringBuffer> w(sb);
    c.Accept(w);
    std::printf("> %s\n", sb.GetString());

    dr::CmdResult r = proc.applyJson(c);
    if (!r.ok) {
      std::printf("  error %s: %s %s\n", r.err.code.c_str(), r.err.message.c_str(),
                  r.err.details.c_str());
      failures++;
      continue;
    }
    if (!r.json.empty()) std::printf("  %s\n", r.json.c_str());
  }

  const dr::DragStats& st = session.stats();
  std::printf("\nstats: started=%u committed=%u cancelled=%u taps=%u moves=%llu "
              "scrollFrames=%llu scrolled=%.1fpx\n",
              st.gesturesStarted, st.gesturesCommitted, st.gesturesCancelled, st.taps,
              static_cast<unsigned long long>(st.movesProcessed),
              static_cast<unsigned long long>(st.scrollFrames), st.scrolledDistancePx);

  std::printf("order:");
  for (const auto& id : order) std::printf(" %s", id.c_str());
  std::printf("\n");

  return failures == 0 ? 0 : 2;
}
