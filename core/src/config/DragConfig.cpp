#include "dr/config/DragConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstdio>
#include <cstring>

namespace dr {

const char* toString(LockAxis axis) {
  switch (axis) {
    case LockAxis::X: return "x";
    case LockAxis::Y: return "y";
    case LockAxis::None:
    default: return "none";
  }
}

const char* toString(LayoutStrategy strategy) {
  switch (strategy) {
    case LayoutStrategy::Horizontal: return "horizontal";
    case LayoutStrategy::Grid: return "grid";
    case LayoutStrategy::Vertical:
    default: return "vertical";
  }
}

// Reads a finite, non-negative number if present. False on a bad value.
static bool readNonNegative(const rapidjson::Value& obj, const char* key, double& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsNumber()) return false;
  double d = v.GetDouble();
  if (!std::isfinite(d) || d < 0.0) return false;
  out = d;
  return true;
}

static bool readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  if (!obj.HasMember(key)) return true;
  if (!obj[key].IsBool()) return false;
  out = obj[key].GetBool();
  return true;
}

bool parseDragConfig(const rapidjson::Value& obj, DragConfig& out) {
  if (!obj.IsObject()) return false;
  DragConfig cfg = out;

  if (!readNonNegative(obj, "activationDelay", cfg.activation.delayMs)) return false;
  if (!readNonNegative(obj, "activationDistance", cfg.activation.distancePx)) return false;
  if (!readBool(obj, "hapticFeedback", cfg.hapticFeedback)) return false;

  if (obj.HasMember("lockAxis")) {
    const auto& v = obj["lockAxis"];
    if (v.IsNull()) {
      cfg.lockAxis = LockAxis::None;
    } else if (v.IsString()) {
      const char* s = v.GetString();
      if (std::strcmp(s, "x") == 0) cfg.lockAxis = LockAxis::X;
      else if (std::strcmp(s, "y") == 0) cfg.lockAxis = LockAxis::Y;
      else if (std::strcmp(s, "none") == 0) cfg.lockAxis = LockAxis::None;
      else return false;
    } else {
      return false;
    }
  }

  if (obj.HasMember("autoScroll")) {
    const auto& as = obj["autoScroll"];
    if (!as.IsObject()) return false;
    if (!readBool(as, "enabled", cfg.autoScroll.enabled)) return false;
    if (!readNonNegative(as, "threshold", cfg.autoScroll.thresholdPx)) return false;
    if (!readNonNegative(as, "maxSpeed", cfg.autoScroll.maxSpeedPxPerFrame)) return false;
    if (!readNonNegative(as, "acceleration", cfg.autoScroll.acceleration)) return false;
  }

  if (obj.HasMember("layout")) {
    const auto& lo = obj["layout"];
    if (!lo.IsObject()) return false;
    if (lo.HasMember("strategy")) {
      if (!lo["strategy"].IsString()) return false;
      const char* s = lo["strategy"].GetString();
      if (std::strcmp(s, "vertical") == 0) cfg.layout.strategy = LayoutStrategy::Vertical;
      else if (std::strcmp(s, "horizontal") == 0) cfg.layout.strategy = LayoutStrategy::Horizontal;
      else if (std::strcmp(s, "grid") == 0) cfg.layout.strategy = LayoutStrategy::Grid;
      else return false;
    }
    if (!readNonNegative(lo, "gap", cfg.layout.gapPx)) return false;
    if (!readNonNegative(lo, "transitionDuration", cfg.layout.transitionMs)) return false;
    if (lo.HasMember("columns")) {
      if (!lo["columns"].IsInt() || lo["columns"].GetInt() < 1) return false;
      cfg.layout.columns = lo["columns"].GetInt();
    }
  }

  out = cfg;
  return true;
}

bool parseDragConfig(const std::string& json, DragConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "DragConfig: invalid JSON object\n");
    return false;
  }
  if (!parseDragConfig(doc, out)) {
    std::fprintf(stderr, "DragConfig: rejected out-of-range or mistyped value\n");
    return false;
  }
  return true;
}

std::string serializeDragConfig(const DragConfig& cfg) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("activationDelay");    w.Double(cfg.activation.delayMs);
  w.Key("activationDistance"); w.Double(cfg.activation.distancePx);
  w.Key("hapticFeedback");     w.Bool(cfg.hapticFeedback);
  w.Key("lockAxis");
  if (cfg.lockAxis == LockAxis::None) w.Null();
  else w.String(toString(cfg.lockAxis));

  w.Key("autoScroll");
  w.StartObject();
  w.Key("enabled");      w.Bool(cfg.autoScroll.enabled);
  w.Key("threshold");    w.Double(cfg.autoScroll.thresholdPx);
  w.Key("maxSpeed");     w.Double(cfg.autoScroll.maxSpeedPxPerFrame);
  w.Key("acceleration"); w.Double(cfg.autoScroll.acceleration);
  w.EndObject();

  w.Key("layout");
  w.StartObject();
  w.Key("strategy"); w.String(toString(cfg.layout.strategy));
  w.Key("gap");      w.Double(cfg.layout.gapPx);
  w.Key("columns");  w.Int(cfg.layout.columns);
  w.Key("transitionDuration"); w.Double(cfg.layout.transitionMs);
  w.EndObject();

  w.EndObject();
  return sb.GetString();
}

} // namespace dr
