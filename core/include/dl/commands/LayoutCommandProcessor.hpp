#pragma once
#include "dl/ids/Id.hpp"
#include "dl/session/LayoutSession.hpp"

#include <cstddef>
#include <string>

#include <rapidjson/document.h>

namespace dl {

struct CmdError {
  std::string code;     // e.g. "NOT_FOUND"
  std::string message;  // human text
  std::string details;  // small JSON string with fields
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
  Id createdId{0};
  bool changed{false};  // the command produced a different tree
};

// JSON command front end for a LayoutSession, one command object per call:
//   {"cmd":"openTab","title":"zsh","content":3,"panelId":1}
class LayoutCommandProcessor {
public:
  explicit LayoutCommandProcessor(LayoutSession& session);

  // Apply a single JSON command object.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // Current tree in the persistence format.
  std::string layoutJson() const;

private:
  LayoutSession& session_;

  // ---- handlers ----
  CmdResult cmdHello(const rapidjson::Value& obj);
  CmdResult cmdSetContainer(const rapidjson::Value& obj);

  CmdResult cmdOpenTab(const rapidjson::Value& obj);
  CmdResult cmdCloseTab(const rapidjson::Value& obj);
  CmdResult cmdActivateTab(const rapidjson::Value& obj);
  CmdResult cmdSplitPanel(const rapidjson::Value& obj);
  CmdResult cmdMoveTab(const rapidjson::Value& obj);
  CmdResult cmdResizeDivider(const rapidjson::Value& obj);

  CmdResult cmdBeginDrag(const rapidjson::Value& obj);
  CmdResult cmdDragMove(const rapidjson::Value& obj);
  CmdResult cmdEndDrag(const rapidjson::Value& obj);
  CmdResult cmdCancelDrag(const rapidjson::Value& obj);

  CmdResult cmdNavigate(const rapidjson::Value& obj);
  CmdResult cmdLoad(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static std::string getStringOrEmpty(const rapidjson::Value& obj, const char* key);
  static Id getIdOrZero(const rapidjson::Value& obj, const char* key);
  static bool getNumber(const rapidjson::Value& obj, const char* key, double& out);
  // Integral and representable as size_t; fractions and overflow are rejected.
  static bool getIndex(const rapidjson::Value& obj, const char* key, std::size_t& out);
  static CmdResult fail(const std::string& code,
                        const std::string& message,
                        const std::string& detailsJson = "{}");
  static CmdResult okResult(Id createdId = 0, bool changed = false);
};

} // namespace dl
