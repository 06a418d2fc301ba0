#include "dl/layout/DividerInteraction.hpp"

#include <cmath>
#include <utility>
#include <vector>

namespace dl {

namespace {

// Converts the pixel delta along the divider's axis into a ratio delta.
float ratioDelta(const Divider& d, const PointerInputState& input) {
  if (d.extent <= 0.0f) return 0.0f;
  double px = d.direction == SplitDirection::Horizontal ? input.dragDx : input.dragDy;
  return static_cast<float>(px / static_cast<double>(d.extent));
}

} // namespace

void DividerInteraction::setConfig(const DividerInteractionConfig& cfg) {
  config_ = cfg;
}

void DividerInteraction::setContainer(const Rect& container) {
  container_ = container;
}

bool DividerInteraction::processInput(const PointerInputState& input, const LayoutTree& tree,
                                      LayoutTree& out) {
  if (container_.width <= 0.0f || container_.height <= 0.0f) return false;

  // Handle active drag first (don't re-hover during drag)
  if (input.dragging && dragging_) {
    float delta = ratioDelta(divider_, input);
    if (std::fabs(delta) > 1e-7f) {
      LayoutTree next = tree.resizingDivider(divider_.path, divider_.index, delta, config_.minRatio);
      if (next != tree) {
        out = std::move(next);
        return true;
      }
    }
    return false;
  }

  // Hit test all dividers, widened by the tolerance on both sides
  float hitWidth = config_.dividerThickness + 2.0f * config_.hitTolerancePx;
  std::vector<Divider> dividers = computeDividers(tree, container_, hitWidth);
  Point cursor{static_cast<float>(input.cursorX), static_cast<float>(input.cursorY)};

  hoveredDivider_ = -1;
  for (std::size_t i = 0; i < dividers.size(); i++) {
    if (dividers[i].hitRect.contains(cursor)) {
      hoveredDivider_ = static_cast<int>(i);
      divider_ = dividers[i];
      break;
    }
  }

  if (input.dragging && !dragging_ && hoveredDivider_ >= 0) {
    // Start drag from hovered divider
    dragging_ = true;

    float delta = ratioDelta(divider_, input);
    if (std::fabs(delta) > 1e-7f) {
      LayoutTree next = tree.resizingDivider(divider_.path, divider_.index, delta, config_.minRatio);
      if (next != tree) {
        out = std::move(next);
        return true;
      }
    }
  }

  if (!input.dragging && dragging_) {
    dragging_ = false;
  }

  return false;
}

} // namespace dl
