#pragma once
#include <cstdint>

namespace dr {

// Light on an over-index change, Medium at drag start and drag end.
enum class FeedbackKind : std::uint8_t { Light = 0, Medium };

inline const char* toString(FeedbackKind k) {
  switch (k) {
    case FeedbackKind::Light: return "light";
    case FeedbackKind::Medium: return "medium";
    default: return "unknown";
  }
}

// Discrete feedback pulse (e.g. haptics). Optional host capability.
class FeedbackSink {
public:
  virtual ~FeedbackSink() = default;
  virtual void pulse(FeedbackKind kind) = 0;
};

} // namespace dr
