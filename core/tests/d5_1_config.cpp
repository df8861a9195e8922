// D5.1: Drag config test (pure C++)
// Tests: defaults, partial overrides, rejected values leave config untouched,
// serialize/parse agreement.

#include "dr/config/DragConfig.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static bool sameConfig(const dr::DragConfig& a, const dr::DragConfig& b) {
  return a.activation.delayMs == b.activation.delayMs &&
         a.activation.distancePx == b.activation.distancePx &&
         a.autoScroll.enabled == b.autoScroll.enabled &&
         a.autoScroll.thresholdPx == b.autoScroll.thresholdPx &&
         a.autoScroll.maxSpeedPxPerFrame == b.autoScroll.maxSpeedPxPerFrame &&
         a.autoScroll.acceleration == b.autoScroll.acceleration &&
         a.layout.strategy == b.layout.strategy &&
         a.layout.gapPx == b.layout.gapPx &&
         a.layout.columns == b.layout.columns &&
         a.layout.transitionMs == b.layout.transitionMs &&
         a.hapticFeedback == b.hapticFeedback &&
         a.lockAxis == b.lockAxis;
}

int main() {
  // --- Test 1: defaults ---
  {
    dr::DragConfig cfg;
    requireTrue(cfg.activation.delayMs == 150, "delay 150");
    requireTrue(cfg.activation.distancePx == 5, "distance 5");
    requireTrue(cfg.autoScroll.enabled, "autoscroll on");
    requireTrue(cfg.autoScroll.thresholdPx == 80, "threshold 80");
    requireTrue(cfg.autoScroll.maxSpeedPxPerFrame == 15, "max speed 15");
    requireTrue(cfg.autoScroll.acceleration == 1.5, "acceleration 1.5");
    requireTrue(cfg.hapticFeedback, "haptics on");
    requireTrue(cfg.lockAxis == dr::LockAxis::None, "no axis lock");
    requireTrue(cfg.layout.strategy == dr::LayoutStrategy::Vertical, "vertical");
    requireTrue(cfg.layout.gapPx == 16, "gap 16");
    requireTrue(cfg.layout.transitionMs == 200, "transition 200ms");
    std::printf("  Test 1 (defaults) PASS\n");
  }

  // --- Test 2: partial JSON overrides only what it names ---
  {
    dr::DragConfig cfg;
    bool ok = dr::parseDragConfig(
      R"({"activationDelay":300,"lockAxis":"y","autoScroll":{"maxSpeed":25},
          "layout":{"strategy":"grid","columns":4},"somethingElse":1})", cfg);
    requireTrue(ok, "parse ok");
    requireTrue(cfg.activation.delayMs == 300, "delay overridden");
    requireTrue(cfg.activation.distancePx == 5, "distance kept");
    requireTrue(cfg.lockAxis == dr::LockAxis::Y, "lock y");
    requireTrue(cfg.autoScroll.maxSpeedPxPerFrame == 25, "max speed overridden");
    requireTrue(cfg.autoScroll.thresholdPx == 80, "threshold kept");
    requireTrue(cfg.layout.strategy == dr::LayoutStrategy::Grid, "grid");
    requireTrue(cfg.layout.columns == 4, "columns 4");
    requireTrue(cfg.layout.gapPx == 16, "gap kept");
    requireTrue(cfg.layout.transitionMs == 200, "transition kept");

    requireTrue(dr::parseDragConfig(R"({"layout":{"transitionDuration":120}})", cfg),
                "transition parses");
    requireTrue(cfg.layout.transitionMs == 120, "transition overridden");

    requireTrue(dr::parseDragConfig(R"({"lockAxis":null})", cfg), "null lock parses");
    requireTrue(cfg.lockAxis == dr::LockAxis::None, "null clears lock");
    std::printf("  Test 2 (partial override) PASS\n");
  }

  // --- Test 3: bad input is rejected without side effects ---
  {
    const char* bad[] = {
      "not json",
      "[1,2,3]",
      R"({"activationDelay":-1})",
      R"({"activationDistance":"far"})",
      R"({"autoScroll":{"threshold":-10}})",
      R"({"autoScroll":5})",
      R"({"lockAxis":"z"})",
      R"({"layout":{"transitionDuration":-1}})",
      R"({"layout":{"strategy":"spiral"}})",
      R"({"layout":{"columns":0}})",
      R"({"hapticFeedback":"yes"})",
      R"({"activationDelay":100,"layout":{"columns":0}})",
    };
    for (const char* text : bad) {
      dr::DragConfig cfg;
      cfg.activation.delayMs = 42;
      requireTrue(!dr::parseDragConfig(text, cfg), "bad config rejected");
      requireTrue(cfg.activation.delayMs == 42, "config untouched after rejection");
    }
    std::printf("  Test 3 (rejections) PASS\n");
  }

  // --- Test 4: serialized config parses back to the same values ---
  {
    dr::DragConfig cfg;
    cfg.activation.delayMs = 220;
    cfg.activation.distancePx = 8;
    cfg.autoScroll.enabled = false;
    cfg.autoScroll.acceleration = 2;
    cfg.layout.strategy = dr::LayoutStrategy::Horizontal;
    cfg.layout.gapPx = 4;
    cfg.hapticFeedback = false;
    cfg.lockAxis = dr::LockAxis::X;

    const std::string json = dr::serializeDragConfig(cfg);
    requireTrue(json.find("\"lockAxis\":\"x\"") != std::string::npos, "lockAxis written");
    requireTrue(json.find("\"strategy\":\"horizontal\"") != std::string::npos, "strategy written");

    dr::DragConfig back;
    requireTrue(dr::parseDragConfig(json, back), "reparse");
    requireTrue(sameConfig(cfg, back), "values preserved");
    std::printf("  Test 4 (serialize) PASS\n");
  }

  std::printf("D5.1 config: ALL PASS\n");
  return 0;
}
