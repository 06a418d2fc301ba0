#pragma once
#include "dl/geometry/Rect.hpp"
#include "dl/ids/Id.hpp"
#include "dl/layout/LayoutTree.hpp"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace dl {

using PanelBounds = std::unordered_map<Id, Rect>;

// Recursive subdivision. Children tile their parent exactly: the running
// edge is accumulated and the last child takes whatever remains.
PanelBounds computeBounds(const LayoutTree& tree, const Rect& container);
PanelBounds computeBounds(const LayoutTree& tree, const Size& container);

// Boundary between children `index` and `index + 1` of the split at `path`.
struct Divider {
  LayoutPath path;
  std::size_t index{0};
  SplitDirection direction{SplitDirection::Horizontal};
  float position{0};   // x for Horizontal splits, y for Vertical
  float extent{0};     // the split's length along its axis
  Rect hitRect;        // `thickness` wide, centred on the boundary
};

std::vector<Divider> computeDividers(const LayoutTree& tree, const Rect& container,
                                     float thickness);

// Header band is the top `headerHeight` of a panel frame (clamped to the
// frame); the body is the remainder.
Rect headerRect(const Rect& frame, float headerHeight);
Rect bodyRect(const Rect& frame, float headerHeight);

} // namespace dl
