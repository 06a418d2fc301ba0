#include "dl/config/EngineConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace dl {

namespace {

void readFloat(const rapidjson::Value& obj, const char* key, float& out) {
  if (obj.HasMember(key) && obj[key].IsNumber())
    out = static_cast<float>(obj[key].GetDouble());
}

bool inUnitInterval(float v) { return v > 0.0f && v < 1.0f; }

} // namespace

DragSessionConfig dragSessionConfig(const EngineConfig& cfg, float scale) {
  DragSessionConfig d;
  d.headerHeight = cfg.headerHeight;
  d.scale = scale;
  d.dropZone = cfg.dropZone;
  d.tabStrip = cfg.tabStrip;
  return d;
}

DividerInteractionConfig dividerConfig(const EngineConfig& cfg) {
  DividerInteractionConfig d;
  d.hitTolerancePx = cfg.hitTolerancePx;
  d.dividerThickness = cfg.dividerThickness;
  d.minRatio = cfg.minRatio;
  return d;
}

RestructureConfig restructureConfig(const EngineConfig& cfg) {
  RestructureConfig r;
  r.splitRatio = cfg.splitRatio;
  return r;
}

std::string serializeEngineConfig(const EngineConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("headerHeight", static_cast<double>(cfg.headerHeight), alloc);
  doc.AddMember("dividerThickness", static_cast<double>(cfg.dividerThickness), alloc);
  doc.AddMember("hitTolerancePx", static_cast<double>(cfg.hitTolerancePx), alloc);
  doc.AddMember("splitRatio", static_cast<double>(cfg.splitRatio), alloc);
  doc.AddMember("minRatio", static_cast<double>(cfg.minRatio), alloc);

  rapidjson::Value dz(rapidjson::kObjectType);
  dz.AddMember("hoverRatio", static_cast<double>(cfg.dropZone.hoverRatio), alloc);
  dz.AddMember("highlightRatio", static_cast<double>(cfg.dropZone.highlightRatio), alloc);
  doc.AddMember("dropZone", dz, alloc);

  rapidjson::Value ts(rapidjson::kObjectType);
  ts.AddMember("minTabWidth", static_cast<double>(cfg.tabStrip.minTabWidth), alloc);
  ts.AddMember("maxTabWidth", static_cast<double>(cfg.tabStrip.maxTabWidth), alloc);
  ts.AddMember("horizontalPadding", static_cast<double>(cfg.tabStrip.horizontalPadding), alloc);
  ts.AddMember("closeButtonWidth", static_cast<double>(cfg.tabStrip.closeButtonWidth), alloc);
  ts.AddMember("glyphAdvance", static_cast<double>(cfg.tabStrip.glyphAdvance), alloc);
  ts.AddMember("spacing", static_cast<double>(cfg.tabStrip.spacing), alloc);
  doc.AddMember("tabStrip", ts, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeEngineConfig(const std::string& json, EngineConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  EngineConfig cfg = out;
  readFloat(doc, "headerHeight", cfg.headerHeight);
  readFloat(doc, "dividerThickness", cfg.dividerThickness);
  readFloat(doc, "hitTolerancePx", cfg.hitTolerancePx);
  readFloat(doc, "splitRatio", cfg.splitRatio);
  readFloat(doc, "minRatio", cfg.minRatio);

  // Drop zones
  if (doc.HasMember("dropZone") && doc["dropZone"].IsObject()) {
    const auto& dz = doc["dropZone"];
    readFloat(dz, "hoverRatio", cfg.dropZone.hoverRatio);
    readFloat(dz, "highlightRatio", cfg.dropZone.highlightRatio);
  }

  // Tab strip
  if (doc.HasMember("tabStrip") && doc["tabStrip"].IsObject()) {
    const auto& ts = doc["tabStrip"];
    readFloat(ts, "minTabWidth", cfg.tabStrip.minTabWidth);
    readFloat(ts, "maxTabWidth", cfg.tabStrip.maxTabWidth);
    readFloat(ts, "horizontalPadding", cfg.tabStrip.horizontalPadding);
    readFloat(ts, "closeButtonWidth", cfg.tabStrip.closeButtonWidth);
    readFloat(ts, "glyphAdvance", cfg.tabStrip.glyphAdvance);
    readFloat(ts, "spacing", cfg.tabStrip.spacing);
  }

  if (cfg.headerHeight < 0.0f || cfg.dividerThickness < 0.0f || cfg.hitTolerancePx < 0.0f)
    return false;
  if (!inUnitInterval(cfg.splitRatio)) return false;
  if (cfg.minRatio < 0.0f || cfg.minRatio >= 0.5f) return false;
  // Hover bands from opposite edges must not overlap
  if (!(cfg.dropZone.hoverRatio > 0.0f && cfg.dropZone.hoverRatio <= 0.5f)) return false;
  if (!(cfg.dropZone.highlightRatio > 0.0f && cfg.dropZone.highlightRatio <= 1.0f)) return false;
  if (cfg.tabStrip.minTabWidth < 0.0f || cfg.tabStrip.maxTabWidth < cfg.tabStrip.minTabWidth)
    return false;

  out = cfg;
  return true;
}

} // namespace dl
