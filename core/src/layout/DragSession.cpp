#include "dl/layout/DragSession.hpp"
#include "dl/layout/BoundsCalculator.hpp"

#include <cstdio>

namespace dl {

const char* dragPhaseName(DragPhase p) {
  switch (p) {
    case DragPhase::Idle:     return "idle";
    case DragPhase::Dragging: return "dragging";
    case DragPhase::Ended:    return "ended";
  }
  return "unknown";
}

void DragSession::clearHover() {
  hasHover_ = false;
  hover_ = HoverTarget{};
}

bool DragSession::startDrag(const Tab& tab, Id sourcePanelId) {
  if (phase_ != DragPhase::Idle) {
    std::fprintf(stderr, "DragSession: startDrag ignored in phase %s\n", dragPhaseName(phase_));
    return false;
  }
  phase_ = DragPhase::Dragging;
  tab_ = tab;
  sourcePanelId_ = sourcePanelId;
  clearHover();
  return true;
}

bool DragSession::updatePosition(const Point& pointer, const LayoutTree& tree,
                                 const Size& container) {
  if (phase_ != DragPhase::Dragging) return false;
  pointer_ = pointer;

  const bool hadHover = hasHover_;
  const HoverTarget previous = hover_;
  clearHover();

  const float headerH = config_.headerHeight * config_.scale;
  PanelBounds bounds = computeBounds(tree, container);

  for (const auto& panel : tree.allPanels()) {
    auto it = bounds.find(panel.id);
    if (it == bounds.end()) continue;

    // Header band plus body make up the whole frame.
    const Rect& frame = it->second;
    if (!frame.contains(pointer)) continue;

    DropZone zone;
    if (computeDropZone(panel, bodyRect(frame, headerH), headerRect(frame, headerH),
                        pointer, config_.dropZone, config_.tabStrip, zone)) {
      hasHover_ = true;
      hover_.panelId = panel.id;
      hover_.zone = zone;
    }
    break;
  }

  if (hadHover != hasHover_) return true;
  if (!hasHover_) return false;
  return previous.panelId != hover_.panelId ||
         previous.zone.kind != hover_.zone.kind ||
         previous.zone.insertIndex != hover_.zone.insertIndex;
}

bool DragSession::endDrag(DropDecision& out) {
  if (phase_ != DragPhase::Dragging) {
    std::fprintf(stderr, "DragSession: endDrag ignored in phase %s\n", dragPhaseName(phase_));
    return false;
  }
  phase_ = DragPhase::Ended;

  const bool committed = hasHover_;
  if (committed) {
    out.tabId = tab_.id;
    out.target.panelId = hover_.panelId;
    out.target.kind = hover_.zone.kind;
    out.target.insertIndex = hover_.zone.insertIndex;
  }
  clearHover();
  return committed;
}

void DragSession::cancelDrag() {
  if (phase_ != DragPhase::Dragging) return;
  phase_ = DragPhase::Idle;
  tab_ = Tab{};
  sourcePanelId_ = kInvalidId;
  clearHover();
}

} // namespace dl
