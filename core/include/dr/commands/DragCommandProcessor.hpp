#pragma once
#include "dr/host/GlobalInputHub.hpp"
#include "dr/input/InputEvents.hpp"

#include <string>

#include <rapidjson/document.h>

namespace dr {

class DragSession;
class GeometryRegistry;
class ManualScheduler;

struct CmdError {
  std::string code;     // e.g. "VALIDATION_MISSING_ID"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  std::string json;     // command output (state snapshot, acceptance), may be empty
};

// Drives a DragSession and its GeometryRegistry from JSON command objects.
//
//   {"cmd":"registerItem","id":"a","index":0,"bounds":[0,0,200,40]}
//   {"cmd":"pointerDown","id":"a","x":10,"y":10}
//   {"cmd":"advance","ms":150}
//   {"cmd":"pointerMove","x":10,"y":90}
//   {"cmd":"pointerUp"}
//
// While a gesture is Active, pointer and key commands are delivered through
// the processor's GlobalInputHub, as window-level input would be.
class DragCommandProcessor {
public:
  // scheduler may be null; advance/frame then fail.
  DragCommandProcessor(DragSession& session, GeometryRegistry& registry,
                       ManualScheduler* scheduler = nullptr);
  ~DragCommandProcessor();

  DragCommandProcessor(const DragCommandProcessor&) = delete;
  DragCommandProcessor& operator=(const DragCommandProcessor&) = delete;

  // Apply a single JSON command object.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  GlobalInputHub& inputHub() { return hub_; }

  // Upper bound for {"cmd":"frame","count":N}.
  static constexpr int kMaxFramesPerCommand = 10000;

private:
  DragSession& session_;
  GeometryRegistry& registry_;
  ManualScheduler* scheduler_;
  GlobalInputHub hub_;

  // ---- handlers ----
  CmdResult cmdRegisterItem(const rapidjson::Value& obj);
  CmdResult cmdUnregisterItem(const rapidjson::Value& obj);
  CmdResult cmdSetConfig(const rapidjson::Value& obj);

  CmdResult cmdPointerDown(const rapidjson::Value& obj);
  CmdResult cmdPointerMove(const rapidjson::Value& obj);
  CmdResult cmdPointerUp(const rapidjson::Value& obj);
  CmdResult cmdPointerCancel(const rapidjson::Value& obj);
  CmdResult cmdKeyDown(const rapidjson::Value& obj);

  CmdResult cmdCancel(const rapidjson::Value& obj);
  CmdResult cmdComplete(const rapidjson::Value& obj);
  CmdResult cmdAdvance(const rapidjson::Value& obj);
  CmdResult cmdFrame(const rapidjson::Value& obj);
  CmdResult cmdState(const rapidjson::Value& obj);

  bool routeGlobal() const;

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static bool getNumber(const rapidjson::Value& obj, const char* key, double& out);
  // Integral JSON number within [minValue, maxValue]; no float truncation.
  static bool getInt(const rapidjson::Value& obj, const char* key,
                     int minValue, int maxValue, int& out);
  static bool readPointer(const rapidjson::Value& obj, PointerEvent& out);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
};

} // namespace dr
