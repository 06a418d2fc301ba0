#include "dl/commands/LayoutCommandProcessor.hpp"

#include "dl/layout/DropZone.hpp"
#include "dl/layout/PanelNavigation.hpp"
#include "dl/serial/LayoutSerializer.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace dl {

namespace {

std::string idDetails(const char* key, Id id) {
  return std::string("{\"") + key + "\":" + std::to_string(id) + "}";
}

} // namespace

LayoutCommandProcessor::LayoutCommandProcessor(LayoutSession& session)
  : session_(session) {}

CmdResult LayoutCommandProcessor::fail(const std::string& code,
                                       const std::string& message,
                                       const std::string& detailsJson) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  r.err.details = detailsJson.empty() ? "{}" : detailsJson;
  r.createdId = 0;
  return r;
}

CmdResult LayoutCommandProcessor::okResult(Id createdId, bool changed) {
  CmdResult r;
  r.ok = true;
  r.createdId = createdId;
  r.changed = changed;
  return r;
}

const rapidjson::Value* LayoutCommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

std::string LayoutCommandProcessor::getStringOrEmpty(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return {};
  if (v->IsString()) return v->GetString();
  return {};
}

Id LayoutCommandProcessor::getIdOrZero(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return 0;

  if (v->IsUint64()) return static_cast<Id>(v->GetUint64());
  if (v->IsInt64() && v->GetInt64() > 0) return static_cast<Id>(v->GetInt64());
  if (v->IsString()) return parseIdString(v->GetString());
  return 0;
}

bool LayoutCommandProcessor::getNumber(const rapidjson::Value& obj, const char* key, double& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return false;
  out = v->GetDouble();
  return true;
}

bool LayoutCommandProcessor::getIndex(const rapidjson::Value& obj, const char* key, std::size_t& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsUint64()) return false;
  std::uint64_t raw = v->GetUint64();
  if (raw > std::numeric_limits<std::size_t>::max()) return false;
  out = static_cast<std::size_t>(raw);
  return true;
}

CmdResult LayoutCommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "LayoutCommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult LayoutCommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  try {
    if (cmd == "hello") return cmdHello(obj);
    if (cmd == "setContainer") return cmdSetContainer(obj);

    if (cmd == "openTab") return cmdOpenTab(obj);
    if (cmd == "closeTab") return cmdCloseTab(obj);
    if (cmd == "activateTab") return cmdActivateTab(obj);
    if (cmd == "splitPanel") return cmdSplitPanel(obj);
    if (cmd == "moveTab") return cmdMoveTab(obj);
    if (cmd == "resizeDivider") return cmdResizeDivider(obj);

    if (cmd == "beginDrag") return cmdBeginDrag(obj);
    if (cmd == "dragMove") return cmdDragMove(obj);
    if (cmd == "endDrag") return cmdEndDrag(obj);
    if (cmd == "cancelDrag") return cmdCancelDrag(obj);

    if (cmd == "navigate") return cmdNavigate(obj);
    if (cmd == "load") return cmdLoad(obj);
  } catch (const std::runtime_error& e) {
    // Id strings with non-digits
    return fail("BAD_ARGUMENT", e.what(), std::string(R"({"cmd":")") + cmd + R"("})");
  }

  return fail("UNKNOWN_COMMAND",
              "Unknown cmd",
              std::string(R"({"cmd":")") + cmd + R"("})");
}

std::string LayoutCommandProcessor::layoutJson() const {
  return session_.saveJSON();
}

// -------------------- session --------------------

CmdResult LayoutCommandProcessor::cmdHello(const rapidjson::Value&) {
  return okResult();
}

CmdResult LayoutCommandProcessor::cmdSetContainer(const rapidjson::Value& obj) {
  double w = 0, h = 0;
  if (!getNumber(obj, "width", w) || !getNumber(obj, "height", h)) {
    return fail("BAD_COMMAND", "setContainer: requires numeric width and height");
  }
  if (w < 0 || h < 0) {
    return fail("BAD_ARGUMENT", "setContainer: negative size");
  }
  double scale = 1.0;
  if (getMember(obj, "scale") && !getNumber(obj, "scale", scale)) {
    return fail("BAD_ARGUMENT", "setContainer: scale must be a number");
  }
  if (!(scale > 0.0)) {
    return fail("BAD_ARGUMENT", "setContainer: scale must be positive");
  }

  session_.setContainer(Size{static_cast<float>(w), static_cast<float>(h)},
                        static_cast<float>(scale));
  return okResult();
}

// -------------------- tabs and panels --------------------

CmdResult LayoutCommandProcessor::cmdOpenTab(const rapidjson::Value& obj) {
  Id panelId = getIdOrZero(obj, "panelId");
  std::string title = getStringOrEmpty(obj, "title");
  Id content = getIdOrZero(obj, "content");

  if (panelId != 0 && !session_.tree().findPanel(panelId)) {
    return fail("NOT_FOUND", "openTab: unknown panel", idDetails("panelId", panelId));
  }

  Id tabId = session_.openTab(title, content, panelId);
  if (tabId == kInvalidId) {
    return fail("NOT_FOUND", "openTab: unknown panel", idDetails("panelId", panelId));
  }
  return okResult(tabId, true);
}

CmdResult LayoutCommandProcessor::cmdCloseTab(const rapidjson::Value& obj) {
  Id tabId = getIdOrZero(obj, "tabId");
  if (tabId == 0) return fail("MISSING_ID", "closeTab: missing tabId");
  if (!session_.closeTab(tabId)) {
    return fail("NOT_FOUND", "closeTab: unknown tab", idDetails("tabId", tabId));
  }
  return okResult(0, true);
}

CmdResult LayoutCommandProcessor::cmdActivateTab(const rapidjson::Value& obj) {
  Id tabId = getIdOrZero(obj, "tabId");
  if (tabId == 0) return fail("MISSING_ID", "activateTab: missing tabId");

  const Panel* p = session_.tree().findPanelContainingTab(tabId);
  if (!p) {
    return fail("NOT_FOUND", "activateTab: unknown tab", idDetails("tabId", tabId));
  }
  bool changed = p->activeTab() == nullptr || p->activeTab()->id != tabId;
  session_.activateTab(tabId);
  return okResult(0, changed);
}

CmdResult LayoutCommandProcessor::cmdSplitPanel(const rapidjson::Value& obj) {
  Id panelId = getIdOrZero(obj, "panelId");
  if (panelId == 0) return fail("MISSING_ID", "splitPanel: missing panelId");

  DropZoneKind edge = DropZoneKind::Left;
  std::string edgeName = getStringOrEmpty(obj, "edge");
  if (!parseDropZoneKind(edgeName.c_str(), edge) || !isEdgeZone(edge)) {
    return fail("BAD_ARGUMENT", "splitPanel: edge must be left, right, top or bottom",
                std::string(R"({"edge":")") + edgeName + R"("})");
  }
  if (!session_.tree().findPanel(panelId)) {
    return fail("NOT_FOUND", "splitPanel: unknown panel", idDetails("panelId", panelId));
  }

  Id created = session_.splitPanel(panelId, edge, getStringOrEmpty(obj, "title"),
                                   getIdOrZero(obj, "content"));
  if (created == kInvalidId) {
    return fail("BAD_STATE", "splitPanel: split rejected", idDetails("panelId", panelId));
  }
  return okResult(created, true);
}

CmdResult LayoutCommandProcessor::cmdMoveTab(const rapidjson::Value& obj) {
  Id tabId = getIdOrZero(obj, "tabId");
  Id panelId = getIdOrZero(obj, "panelId");
  if (tabId == 0 || panelId == 0) {
    return fail("MISSING_ID", "moveTab: requires tabId and panelId");
  }

  DropTarget target;
  target.panelId = panelId;
  std::string zoneName = getStringOrEmpty(obj, "zone");
  if (!parseDropZoneKind(zoneName.c_str(), target.kind)) {
    return fail("BAD_ARGUMENT", "moveTab: unknown zone",
                std::string(R"({"zone":")") + zoneName + R"("})");
  }
  if (getMember(obj, "index") && !getIndex(obj, "index", target.insertIndex)) {
    return fail("BAD_ARGUMENT", "moveTab: index must be a non-negative integer");
  }

  if (!session_.tree().containsTab(tabId)) {
    return fail("NOT_FOUND", "moveTab: unknown tab", idDetails("tabId", tabId));
  }
  if (!session_.tree().findPanel(panelId)) {
    return fail("NOT_FOUND", "moveTab: unknown panel", idDetails("panelId", panelId));
  }

  return okResult(0, session_.moveTab(tabId, target));
}

CmdResult LayoutCommandProcessor::cmdResizeDivider(const rapidjson::Value& obj) {
  const auto* pathV = getMember(obj, "path");
  if (!pathV || !pathV->IsArray()) {
    return fail("BAD_COMMAND", "resizeDivider: requires path array");
  }
  LayoutPath path;
  for (const auto& step : pathV->GetArray()) {
    if (!step.IsUint64()) return fail("BAD_ARGUMENT", "resizeDivider: path entries must be indices");
    path.push_back(static_cast<std::size_t>(step.GetUint64()));
  }

  double delta = 0;
  if (!getMember(obj, "index") || !getNumber(obj, "delta", delta)) {
    return fail("BAD_COMMAND", "resizeDivider: requires index and delta");
  }
  std::size_t index = 0;
  if (!getIndex(obj, "index", index)) {
    return fail("BAD_ARGUMENT", "resizeDivider: index must be a non-negative integer");
  }

  const LayoutTree* node = session_.tree().subtreeAt(path);
  if (!node || !node->isSplit()) {
    return fail("NOT_FOUND", "resizeDivider: path does not name a split");
  }
  if (index + 1 >= node->children().size()) {
    return fail("BAD_ARGUMENT", "resizeDivider: divider index out of range");
  }

  bool changed = session_.resizeDivider(path, index, static_cast<float>(delta));
  return okResult(0, changed);
}

// -------------------- drag --------------------

CmdResult LayoutCommandProcessor::cmdBeginDrag(const rapidjson::Value& obj) {
  Id tabId = getIdOrZero(obj, "tabId");
  if (tabId == 0) return fail("MISSING_ID", "beginDrag: missing tabId");
  if (session_.drag() && session_.drag()->isDragging()) {
    return fail("BAD_STATE", "beginDrag: drag already in progress");
  }
  if (!session_.tree().containsTab(tabId)) {
    return fail("NOT_FOUND", "beginDrag: unknown tab", idDetails("tabId", tabId));
  }
  if (!session_.beginDrag(tabId)) {
    return fail("BAD_STATE", "beginDrag: rejected");
  }
  return okResult();
}

CmdResult LayoutCommandProcessor::cmdDragMove(const rapidjson::Value& obj) {
  if (!session_.drag()) return fail("BAD_STATE", "dragMove: no drag in progress");
  double x = 0, y = 0;
  if (!getNumber(obj, "x", x) || !getNumber(obj, "y", y)) {
    return fail("BAD_COMMAND", "dragMove: requires numeric x and y");
  }
  session_.dragMove(Point{static_cast<float>(x), static_cast<float>(y)});
  return okResult();
}

CmdResult LayoutCommandProcessor::cmdEndDrag(const rapidjson::Value&) {
  if (!session_.drag()) return fail("BAD_STATE", "endDrag: no drag in progress");
  return okResult(0, session_.endDrag());
}

CmdResult LayoutCommandProcessor::cmdCancelDrag(const rapidjson::Value&) {
  if (!session_.drag()) return fail("BAD_STATE", "cancelDrag: no drag in progress");
  session_.cancelDrag();
  return okResult();
}

// -------------------- navigation / persistence --------------------

CmdResult LayoutCommandProcessor::cmdNavigate(const rapidjson::Value& obj) {
  Id panelId = getIdOrZero(obj, "panelId");
  if (panelId == 0) return fail("MISSING_ID", "navigate: missing panelId");

  NavDirection dir = NavDirection::Left;
  std::string dirName = getStringOrEmpty(obj, "direction");
  if (!parseNavDirection(dirName.c_str(), dir)) {
    return fail("BAD_ARGUMENT", "navigate: unknown direction",
                std::string(R"({"direction":")") + dirName + R"("})");
  }
  if (!session_.tree().findPanel(panelId)) {
    return fail("NOT_FOUND", "navigate: unknown panel", idDetails("panelId", panelId));
  }

  // createdId carries the target; 0 when nothing lies in that direction.
  return okResult(session_.navigate(panelId, dir));
}

CmdResult LayoutCommandProcessor::cmdLoad(const rapidjson::Value& obj) {
  const auto* layoutV = getMember(obj, "layout");
  if (!layoutV || !layoutV->IsObject()) {
    return fail("BAD_COMMAND", "load: requires layout object");
  }
  const auto* rootV = getMember(*layoutV, "root");
  if (!rootV) return fail("BAD_COMMAND", "load: layout has no root");

  LayoutTree parsed;
  if (!layoutFromJson(*rootV, parsed)) {
    return fail("BAD_ARGUMENT", "load: layout rejected");
  }
  session_.reset(parsed);
  return okResult(0, true);
}

} // namespace dl
