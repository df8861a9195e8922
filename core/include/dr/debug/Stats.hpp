#pragma once
#include <cstdint>

namespace dr {

struct DragStats {
  // Gestures
  std::uint32_t gesturesStarted = 0;
  std::uint32_t gesturesCommitted = 0;
  std::uint32_t gesturesCancelled = 0;
  std::uint32_t forcedCancels = 0;   // dragged item vanished
  std::uint32_t taps = 0;            // released before activation

  // Tracking
  std::uint64_t movesProcessed = 0;
  std::uint64_t hitTestMisses = 0;
  std::uint32_t overChanges = 0;

  // Auto-scroll
  std::uint64_t scrollFrames = 0;    // frames that actually moved content
  double scrolledDistancePx = 0.0;   // |dx| + |dy| summed
};

} // namespace dr
