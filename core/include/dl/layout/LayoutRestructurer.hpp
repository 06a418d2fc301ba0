#pragma once
#include "dl/layout/DropZone.hpp"
#include "dl/layout/LayoutTree.hpp"

namespace dl {

struct RestructureConfig {
  float splitRatio{0.5f};  // share given to the new panel on an edge drop
};

// Produces the tree that results from dropping tab `tabId` on `drop`.
//
// Header: move into the target's tab list at insertIndex (clamped) and
//         activate. Same-panel moves compensate for the tab's own slot and
//         return the input unchanged when the position would not change.
// Body:   only for a target with no tabs.
// Edges:  the target leaf becomes a split of the target and a new leaf
//         holding only the tab. The new leaf reuses the source panel's id
//         when the move empties the source, otherwise takes maxPanelId + 1.
//
// An unknown tab or target returns the input. Moving a panel's only tab
// onto an edge of that same panel is a no-op.
LayoutTree restructure(const LayoutTree& tree, Id tabId, const DropTarget& drop,
                       const RestructureConfig& cfg = RestructureConfig{});

inline LayoutTree applyDrop(const LayoutTree& tree, const DropDecision& decision,
                            const RestructureConfig& cfg = RestructureConfig{}) {
  return restructure(tree, decision.tabId, decision.target, cfg);
}

} // namespace dl
