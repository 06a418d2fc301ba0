#pragma once
#include "dl/config/EngineConfig.hpp"
#include "dl/geometry/Rect.hpp"
#include "dl/ids/Id.hpp"
#include "dl/input/PointerInput.hpp"
#include "dl/layout/BoundsCalculator.hpp"
#include "dl/layout/DividerInteraction.hpp"
#include "dl/layout/DragSession.hpp"
#include "dl/layout/LayoutTree.hpp"
#include "dl/layout/PanelNavigation.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace dl {

// Owns "the current tree" of one window and wires the engine's pure pieces
// together for the host: id allocation, container size, the in-flight drag
// gesture and divider dragging. One instance per window; not thread-safe.
class LayoutSession {
public:
  explicit LayoutSession(const EngineConfig& cfg = EngineConfig{});

  void setConfig(const EngineConfig& cfg);
  const EngineConfig& config() const { return config_; }

  // Container in device pixels; `scale` converts the logical header height.
  void setContainer(const Size& size, float scale = 1.0f);
  const Size& container() const { return container_; }
  float scale() const { return scale_; }

  // Replaces the tree wholesale (e.g. after restoring a window). Cancels any
  // drag in flight.
  void reset(const LayoutTree& tree);
  const LayoutTree& tree() const { return tree_; }
  bool isEmpty() const { return tree_.isEmpty(); }

  PanelBounds bounds() const;

  // Adds a tab to `panelId`, or to the first panel when panelId is 0. An
  // empty window gets a fresh panel. Returns the new tab id, or kInvalidId
  // when panelId names no panel.
  Id openTab(const std::string& title, std::uint64_t content, Id panelId = kInvalidId);

  // Returns false for unknown tabs. Closing the last tab leaves an empty tree.
  bool closeTab(Id tabId);
  bool activateTab(Id tabId);

  // Programmatic split: a new panel with one new tab beside `targetPanelId`.
  // Returns the new panel id, or kInvalidId if the target is unknown or
  // `edge` is not an edge zone.
  Id splitPanel(Id targetPanelId, DropZoneKind edge,
                const std::string& title, std::uint64_t content);

  // Non-drag move (keyboard or menu). Returns true if the tree changed.
  bool moveTab(Id tabId, const DropTarget& target);

  bool resizeDivider(const LayoutPath& path, std::size_t dividerIndex, float delta);

  Id navigate(Id fromPanelId, NavDirection direction) const;

  // ---- drag gesture ----
  bool beginDrag(Id tabId);
  bool dragMove(const Point& pointer);
  // Commits the hovered drop. Returns true if the tree changed.
  bool endDrag();
  void cancelDrag();
  // nullptr when no gesture is in flight.
  const DragSession* drag() const { return drag_.get(); }

  // Divider hover / resize. Returns true if the tree changed.
  bool processDividerInput(const PointerInputState& input);
  const DividerInteraction& dividers() const { return dividers_; }

  // ---- persistence ----
  std::string saveJSON() const;
  bool loadJSON(const std::string& json);

private:
  // Installs `next` and keeps the id counters ahead of everything in it.
  void commit(LayoutTree next);
  Rect containerRect() const { return Rect{0.0f, 0.0f, container_.width, container_.height}; }

  EngineConfig config_;
  LayoutTree tree_;
  Size container_{800.0f, 600.0f};
  float scale_{1.0f};
  IdAllocator ids_;
  std::unique_ptr<DragSession> drag_;
  DividerInteraction dividers_;
};

} // namespace dl
