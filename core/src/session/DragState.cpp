#include "dr/session/DragState.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace dr {

const char* toString(DragPhase phase) {
  switch (phase) {
    case DragPhase::Idle: return "idle";
    case DragPhase::Pending: return "pending";
    case DragPhase::Active: return "active";
    case DragPhase::Ending: return "ending";
    default: return "unknown";
  }
}

static void writePosition(rapidjson::Writer<rapidjson::StringBuffer>& w,
                          const char* key, const Position& p) {
  w.Key(key);
  w.StartObject();
  w.Key("x"); w.Double(p.x);
  w.Key("y"); w.Double(p.y);
  w.EndObject();
}

std::string serializeDragState(const DragSessionState& state) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("phase"); w.String(toString(state.phase));

  w.Key("draggedId");
  if (state.draggedId.empty()) w.Null();
  else w.String(state.draggedId.c_str());

  w.Key("originIndex");
  if (state.originIndex < 0) w.Null();
  else w.Int(state.originIndex);

  w.Key("overIndex");
  if (state.overIndex < 0) w.Null();
  else w.Int(state.overIndex);

  writePosition(w, "initialPosition", state.initialPosition);
  writePosition(w, "currentPosition", state.currentPosition);
  writePosition(w, "pointerOffset", state.pointerOffsetWithinItem);
  writePosition(w, "scrollDelta", state.accumulatedScrollDelta);
  w.EndObject();

  return sb.GetString();
}

} // namespace dr
