#include "dr/commands/DragCommandProcessor.hpp"

#include "dr/config/DragConfig.hpp"
#include "dr/geometry/GeometryRegistry.hpp"
#include "dr/host/ManualScheduler.hpp"
#include "dr/session/DragSession.hpp"

#include <rapidjson/document.h>

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>

namespace dr {

DragCommandProcessor::DragCommandProcessor(DragSession& session, GeometryRegistry& registry,
                                           ManualScheduler* scheduler)
  : session_(session), registry_(registry), scheduler_(scheduler) {
  session_.setGlobalInputSource(&hub_);
}

DragCommandProcessor::~DragCommandProcessor() {
  session_.setGlobalInputSource(nullptr);
}

CmdResult DragCommandProcessor::fail(const std::string& code,
                                     const std::string& message,
                                     const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  return r;
}

const rapidjson::Value* DragCommandProcessor::getMember(const rapidjson::Value& obj,
                                                        const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string DragCommandProcessor::getStringOrEmpty(const rapidjson::Value& obj,
                                                   const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

bool DragCommandProcessor::getNumber(const rapidjson::Value& obj, const char* key, double& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return false;
  const double d = v->GetDouble();
  if (!std::isfinite(d)) return false;
  out = d;
  return true;
}

bool DragCommandProcessor::getInt(const rapidjson::Value& obj, const char* key,
                                  int minValue, int maxValue, int& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsInt()) return false;
  const int n = v->GetInt();
  if (n < minValue || n > maxValue) return false;
  out = n;
  return true;
}

bool DragCommandProcessor::readPointer(const rapidjson::Value& obj, PointerEvent& out) {
  PointerEvent ev;
  if (!getNumber(obj, "x", ev.x) || !getNumber(obj, "y", ev.y)) return false;

  const std::string type = getStringOrEmpty(obj, "pointerType");
  if (type == "touch") ev.type = PointerType::Touch;
  else if (type == "pen") ev.type = PointerType::Pen;
  else ev.type = PointerType::Mouse;

  const int intMax = std::numeric_limits<int>::max();
  if (getMember(obj, "button") && !getInt(obj, "button", 0, intMax, ev.button)) return false;
  if (getMember(obj, "touches") && !getInt(obj, "touches", 0, intMax, ev.touchCount)) return false;

  out = ev;
  return true;
}

bool DragCommandProcessor::routeGlobal() const {
  return session_.phase() == DragPhase::Active;
}

CmdResult DragCommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "DragCommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult DragCommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "registerItem") return cmdRegisterItem(obj);
  if (cmd == "unregisterItem") return cmdUnregisterItem(obj);
  if (cmd == "setConfig") return cmdSetConfig(obj);

  if (cmd == "pointerDown") return cmdPointerDown(obj);
  if (cmd == "pointerMove") return cmdPointerMove(obj);
  if (cmd == "pointerUp") return cmdPointerUp(obj);
  if (cmd == "pointerCancel") return cmdPointerCancel(obj);
  if (cmd == "keyDown") return cmdKeyDown(obj);

  if (cmd == "cancel") return cmdCancel(obj);
  if (cmd == "complete") return cmdComplete(obj);
  if (cmd == "advance") return cmdAdvance(obj);
  if (cmd == "frame") return cmdFrame(obj);
  if (cmd == "state") return cmdState(obj);

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

// -------------------- registry / config --------------------

CmdResult DragCommandProcessor::cmdRegisterItem(const rapidjson::Value& obj) {
  const std::string id = getStringOrEmpty(obj, "id");
  if (id.empty()) {
    return fail("VALIDATION_MISSING_ID", "registerItem: missing string id");
  }

  int index = -1;
  if (!getInt(obj, "index", 0, std::numeric_limits<int>::max(), index)) {
    return fail("VALIDATION_BAD_INDEX",
                "registerItem: index must be a non-negative integer",
                std::string(R"({"id":")") + id + R"("})");
  }

  const auto* b = getMember(obj, "bounds");
  if (!b || !b->IsArray() || b->Size() != 4) {
    return fail("VALIDATION_BAD_BOUNDS", "registerItem: bounds must be [left,top,right,bottom]");
  }
  double v[4];
  for (rapidjson::SizeType i = 0; i < 4; i++) {
    if (!(*b)[i].IsNumber()) {
      return fail("VALIDATION_BAD_BOUNDS", "registerItem: bounds must be numeric");
    }
    v[i] = (*b)[i].GetDouble();
  }
  Rect r{v[0], v[1], v[2], v[3]};
  if (!r.isValid()) {
    return fail("VALIDATION_BAD_BOUNDS",
                "registerItem: bounds are inverted or non-finite",
                std::string(R"({"id":")") + id + R"("})");
  }

  bool disabled = false;
  const auto* dv = getMember(obj, "disabled");
  if (dv && dv->IsBool()) disabled = dv->GetBool();

  if (!registry_.registerItem(id, index, r, disabled)) {
    return fail("BAD_COMMAND", "registerItem: rejected by registry");
  }
  return CmdResult{};
}

CmdResult DragCommandProcessor::cmdUnregisterItem(const rapidjson::Value& obj) {
  const std::string id = getStringOrEmpty(obj, "id");
  if (id.empty()) {
    return fail("VALIDATION_MISSING_ID", "unregisterItem: missing string id");
  }
  registry_.unregisterItem(id);
  session_.revalidate();
  return CmdResult{};
}

CmdResult DragCommandProcessor::cmdSetConfig(const rapidjson::Value& obj) {
  const auto* c = getMember(obj, "config");
  if (!c || !c->IsObject()) {
    return fail("BAD_CONFIG", "setConfig: missing object field config");
  }
  DragConfig cfg = session_.config();
  if (!parseDragConfig(*c, cfg)) {
    return fail("BAD_CONFIG", "setConfig: invalid config values");
  }
  session_.setConfig(cfg);
  return CmdResult{};
}

// -------------------- input --------------------

CmdResult DragCommandProcessor::cmdPointerDown(const rapidjson::Value& obj) {
  const std::string id = getStringOrEmpty(obj, "id");
  if (id.empty()) {
    return fail("VALIDATION_MISSING_ID", "pointerDown: missing string id");
  }
  PointerEvent ev;
  if (!readPointer(obj, ev)) {
    return fail("BAD_COMMAND", "pointerDown: x and y must be numbers");
  }
  if (!registry_.contains(id)) {
    return fail("UNKNOWN_ITEM",
                "pointerDown: item is not registered",
                std::string(R"({"id":")") + id + R"("})");
  }

  const bool accepted = session_.pointerDown(id, ev);

  CmdResult r;
  r.json = accepted ? R"({"accepted":true})" : R"({"accepted":false})";
  return r;
}

CmdResult DragCommandProcessor::cmdPointerMove(const rapidjson::Value& obj) {
  PointerEvent ev;
  if (!readPointer(obj, ev)) {
    return fail("BAD_COMMAND", "pointerMove: x and y must be numbers");
  }
  if (routeGlobal()) hub_.dispatchPointerMove(ev);
  else session_.pointerMove(ev);
  return CmdResult{};
}

CmdResult DragCommandProcessor::cmdPointerUp(const rapidjson::Value& obj) {
  PointerEvent ev;
  if (!readPointer(obj, ev)) {
    ev.x = session_.state().currentPosition.x;
    ev.y = session_.state().currentPosition.y;
  }
  if (routeGlobal()) hub_.dispatchPointerUp(ev);
  else session_.pointerUp(ev);
  return CmdResult{};
}

CmdResult DragCommandProcessor::cmdPointerCancel(const rapidjson::Value&) {
  if (routeGlobal()) hub_.dispatchPointerCancel();
  else session_.pointerCancel();
  return CmdResult{};
}

CmdResult DragCommandProcessor::cmdKeyDown(const rapidjson::Value& obj) {
  const std::string key = getStringOrEmpty(obj, "key");
  if (key.empty()) {
    return fail("BAD_COMMAND", "keyDown: missing string key");
  }
  const KeyCode code = key == "Escape" ? KeyCode::Escape : KeyCode::Other;
  if (routeGlobal()) hub_.dispatchKeyDown(code);
  else session_.keyDown(code);
  return CmdResult{};
}

// -------------------- control --------------------

CmdResult DragCommandProcessor::cmdCancel(const rapidjson::Value&) {
  session_.cancel();
  return CmdResult{};
}

CmdResult DragCommandProcessor::cmdComplete(const rapidjson::Value&) {
  session_.complete();
  return CmdResult{};
}

CmdResult DragCommandProcessor::cmdAdvance(const rapidjson::Value& obj) {
  if (!scheduler_) {
    return fail("BAD_COMMAND", "advance: no manual scheduler attached");
  }
  double ms = 0;
  if (!getNumber(obj, "ms", ms) || ms < 0) {
    return fail("BAD_COMMAND", "advance: ms must be a non-negative number");
  }
  scheduler_->advance(ms);
  return CmdResult{};
}

CmdResult DragCommandProcessor::cmdFrame(const rapidjson::Value& obj) {
  if (!scheduler_) {
    return fail("BAD_COMMAND", "frame: no manual scheduler attached");
  }
  int count = 1;
  if (getMember(obj, "count") && !getInt(obj, "count", 0, kMaxFramesPerCommand, count)) {
    return fail("BAD_COMMAND",
                "frame: count must be an integer in [0, " +
                    std::to_string(kMaxFramesPerCommand) + "]");
  }
  const std::size_t ran = scheduler_->runFrames(static_cast<std::size_t>(count));

  CmdResult r;
  r.json = std::string(R"({"ran":)") + std::to_string(ran) + "}";
  return r;
}

CmdResult DragCommandProcessor::cmdState(const rapidjson::Value&) {
  CmdResult r;
  r.json = serializeDragState(session_.state());
  return r;
}

} // namespace dr
