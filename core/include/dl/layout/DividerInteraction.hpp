#pragma once
#include "dl/geometry/Rect.hpp"
#include "dl/input/PointerInput.hpp"
#include "dl/layout/BoundsCalculator.hpp"
#include "dl/layout/LayoutTree.hpp"

namespace dl {

struct DividerInteractionConfig {
  float hitTolerancePx{4.0f};   // added on both sides of the divider
  float dividerThickness{3.0f};
  float minRatio{0.1f};         // smallest share a child can be dragged to
};

// Divider hover and drag-to-resize. Holds only gesture state; the tree stays
// with the caller and every resize is returned as a new tree.
class DividerInteraction {
public:
  void setConfig(const DividerInteractionConfig& cfg);
  void setContainer(const Rect& container);

  // Returns true and writes `out` when the drag changed the split ratios.
  bool processInput(const PointerInputState& input, const LayoutTree& tree, LayoutTree& out);

  bool isDragging() const { return dragging_; }
  int hoveredDivider() const { return hoveredDivider_; }
  // Valid while hoveredDivider() >= 0 or isDragging().
  const Divider& activeDivider() const { return divider_; }

private:
  DividerInteractionConfig config_;
  Rect container_{0.0f, 0.0f, 800.0f, 600.0f};
  bool dragging_{false};
  int hoveredDivider_{-1};
  Divider divider_;
};

} // namespace dl
