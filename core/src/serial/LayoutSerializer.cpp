#include "dl/serial/LayoutSerializer.hpp"

#include <cmath>
#include <cstdio>
#include <vector>

#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace dl {

namespace {

constexpr int kMaxDepth = 64;

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

void writeNode(Writer& w, const LayoutTree& node) {
  if (node.isLeaf()) {
    const Panel& p = node.panel();
    w.StartObject();
    w.Key("type");  w.String("leaf");
    w.Key("panel");
    w.StartObject();
    w.Key("id");             w.Uint64(p.id);
    w.Key("activeTabIndex"); w.Uint64(static_cast<std::uint64_t>(p.activeTabIndex));
    w.Key("tabs");
    w.StartArray();
    for (const auto& t : p.tabs) {
      w.StartObject();
      w.Key("id");      w.Uint64(t.id);
      w.Key("title");   w.String(t.title.c_str(), static_cast<rapidjson::SizeType>(t.title.size()));
      w.Key("content"); w.Uint64(t.content);
      w.EndObject();
    }
    w.EndArray();
    w.EndObject();
    w.EndObject();
    return;
  }

  w.StartObject();
  w.Key("type");      w.String("split");
  w.Key("direction"); w.String(splitDirectionName(node.direction()));
  w.Key("ratios");
  w.StartArray();
  for (float r : node.ratios()) w.Double(static_cast<double>(r));
  w.EndArray();
  w.Key("children");
  w.StartArray();
  for (const auto& c : node.children()) writeNode(w, c);
  w.EndArray();
  w.EndObject();
}

bool readTab(const rapidjson::Value& v, Tab& out) {
  if (!v.IsObject()) return false;
  if (!v.HasMember("id") || !v["id"].IsUint64()) return false;
  out.id = static_cast<Id>(v["id"].GetUint64());
  if (v.HasMember("title") && v["title"].IsString())
    out.title.assign(v["title"].GetString(), v["title"].GetStringLength());
  if (v.HasMember("content") && v["content"].IsUint64())
    out.content = v["content"].GetUint64();
  return true;
}

bool readPanel(const rapidjson::Value& v, Panel& out) {
  if (!v.IsObject()) return false;
  if (!v.HasMember("id") || !v["id"].IsUint64()) return false;
  if (!v.HasMember("tabs") || !v["tabs"].IsArray()) return false;

  out.id = static_cast<Id>(v["id"].GetUint64());
  out.tabs.clear();
  for (const auto& tv : v["tabs"].GetArray()) {
    Tab t;
    if (!readTab(tv, t)) return false;
    out.tabs.push_back(std::move(t));
  }
  out.activeTabIndex = 0;
  if (v.HasMember("activeTabIndex") && v["activeTabIndex"].IsUint64())
    out.activeTabIndex = static_cast<std::size_t>(v["activeTabIndex"].GetUint64());
  return true;
}

bool readNode(const rapidjson::Value& v, int depth, LayoutTree& out) {
  if (depth > kMaxDepth) return false;
  if (!v.IsObject() || !v.HasMember("type") || !v["type"].IsString()) return false;
  const std::string type = v["type"].GetString();

  if (type == "leaf") {
    if (!v.HasMember("panel")) return false;
    Panel p;
    if (!readPanel(v["panel"], p)) return false;
    out = LayoutTree::leaf(std::move(p));
    return true;
  }

  if (type != "split") return false;

  SplitDirection dir;
  if (!v.HasMember("direction") || !v["direction"].IsString() ||
      !parseSplitDirection(v["direction"].GetString(), dir)) {
    return false;
  }
  if (!v.HasMember("ratios") || !v["ratios"].IsArray()) return false;
  if (!v.HasMember("children") || !v["children"].IsArray()) return false;

  const auto& ra = v["ratios"].GetArray();
  const auto& ca = v["children"].GetArray();
  if (ca.Size() < 2 || ra.Size() != ca.Size()) return false;

  std::vector<float> ratios;
  ratios.reserve(ra.Size());
  for (const auto& r : ra) {
    if (!r.IsNumber()) return false;
    float f = static_cast<float>(r.GetDouble());
    if (!(f > 0.0f) || !std::isfinite(f)) return false;
    ratios.push_back(f);
  }

  std::vector<LayoutTree> children;
  children.reserve(ca.Size());
  for (const auto& c : ca) {
    LayoutTree child;
    if (!readNode(c, depth + 1, child)) return false;
    children.push_back(std::move(child));
  }

  out = LayoutTree::split(dir, std::move(children), std::move(ratios));
  return true;
}

} // namespace

std::string serializeLayout(const LayoutTree& tree) {
  rapidjson::StringBuffer sb;
  Writer w(sb);

  w.StartObject();
  w.Key("version"); w.String("1.0");
  w.Key("root");
  if (tree.isEmpty()) {
    w.Null();
  } else {
    writeNode(w, tree);
  }
  w.EndObject();

  return sb.GetString();
}

bool layoutFromJson(const rapidjson::Value& root, LayoutTree& out) {
  LayoutTree parsed;
  if (!root.IsNull() && !readNode(root, 0, parsed)) return false;

  std::string why;
  if (!parsed.validate(&why)) {
    std::fprintf(stderr, "LayoutSerializer: rejected layout: %s\n", why.c_str());
    return false;
  }
  out = std::move(parsed);
  return true;
}

bool deserializeLayout(const std::string& json, LayoutTree& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;
  if (!doc.HasMember("root")) return false;
  return layoutFromJson(doc["root"], out);
}

} // namespace dl
