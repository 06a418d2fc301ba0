#pragma once
#include "dl/geometry/Rect.hpp"
#include "dl/layout/DropZone.hpp"
#include "dl/layout/DropZoneCalculator.hpp"
#include "dl/layout/LayoutTree.hpp"
#include "dl/layout/TabStrip.hpp"

#include <cstdint>

namespace dl {

// Drag gesture state machine.
// States: Idle -> Dragging -> Ended, with cancelDrag() taking Dragging back
// to Idle. Nothing leaves Ended; the host discards the session and creates a
// new one for the next gesture.
enum class DragPhase : std::uint8_t {
  Idle = 0,
  Dragging,
  Ended
};

struct DragSessionConfig {
  float headerHeight{30.0f};  // logical units
  float scale{1.0f};          // device pixels per logical unit
  DropZoneConfig dropZone;
  TabStripConfig tabStrip;
};

struct HoverTarget {
  Id panelId{kInvalidId};
  DropZone zone;
};

class DragSession {
public:
  DragSession() = default;
  explicit DragSession(const DragSessionConfig& cfg) : config_(cfg) {}

  void setConfig(const DragSessionConfig& cfg) { config_ = cfg; }
  const DragSessionConfig& config() const { return config_; }

  // Idle -> Dragging. Returns false (and changes nothing) in any other phase.
  bool startDrag(const Tab& tab, Id sourcePanelId);

  // Re-evaluates the hover target against the caller's current tree. The
  // first panel in allPanels() order whose frame contains the pointer
  // decides. Returns true if the hover target changed.
  bool updatePosition(const Point& pointer, const LayoutTree& tree, const Size& container);

  // Dragging -> Ended. Returns true and fills `out` if a drop zone was
  // hovered; false means the drag produced no change.
  bool endDrag(DropDecision& out);

  // Dragging -> Idle without a decision.
  void cancelDrag();

  DragPhase phase() const { return phase_; }
  bool isDragging() const { return phase_ == DragPhase::Dragging; }
  const Tab& draggedTab() const { return tab_; }
  Id sourcePanelId() const { return sourcePanelId_; }
  bool hasHover() const { return hasHover_; }
  const HoverTarget& hover() const { return hover_; }
  Point pointer() const { return pointer_; }

private:
  void clearHover();

  DragSessionConfig config_;
  DragPhase phase_{DragPhase::Idle};
  Tab tab_;
  Id sourcePanelId_{kInvalidId};
  bool hasHover_{false};
  HoverTarget hover_;
  Point pointer_;
};

const char* dragPhaseName(DragPhase p);

} // namespace dl
