#pragma once
#include "dr/displacement/Displacement.hpp"
#include "dr/scroll/AutoScroller.hpp"

#include <cstdint>
#include <string>

#include <rapidjson/document.h>

namespace dr {

// Pending -> Active on whichever comes first.
struct ActivationConfig {
  double delayMs{150.0};     // held without crossing distancePx
  double distancePx{5.0};    // moved at least this far from the press
};

// X pins x to its activation value, Y pins y.
enum class LockAxis : std::uint8_t { None = 0, X, Y };

struct DragConfig {
  ActivationConfig activation;
  AutoScrollConfig autoScroll;
  LayoutConfig layout;
  bool hapticFeedback{true};
  LockAxis lockAxis{LockAxis::None};
};

const char* toString(LockAxis axis);
const char* toString(LayoutStrategy strategy);

// Partial JSON overrides the defaults already in `out`. Unknown keys are
// ignored. Returns false (and leaves `out` untouched) on malformed JSON or
// out-of-range values.
//
// {
//   "activationDelay": 150, "activationDistance": 5,
//   "hapticFeedback": true, "lockAxis": "x" | "y" | null,
//   "autoScroll": {"enabled": true, "threshold": 80, "maxSpeed": 15, "acceleration": 1.5},
//   "layout": {"strategy": "vertical" | "horizontal" | "grid", "gap": 16, "columns": 1,
//              "transitionDuration": 200}
// }
bool parseDragConfig(const std::string& json, DragConfig& out);
bool parseDragConfig(const rapidjson::Value& obj, DragConfig& out);

std::string serializeDragConfig(const DragConfig& cfg);

} // namespace dr
