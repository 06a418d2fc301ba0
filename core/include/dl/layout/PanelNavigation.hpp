#pragma once
#include "dl/geometry/Rect.hpp"
#include "dl/ids/Id.hpp"
#include "dl/layout/LayoutTree.hpp"

#include <cstdint>

namespace dl {

enum class NavDirection : std::uint8_t { Left = 1, Right, Up, Down };

// Directional focus move between panels.
// Left/Right: candidates whose vertical range contains the current panel's
// top edge; the horizontally closest wins. Up/Down: same with the left edge
// against horizontal ranges. Without a range match, the candidate whose range
// edge is closest wins.
// Returns kInvalidId when nothing lies in that direction.
Id findNearestPanel(const LayoutTree& tree, const Rect& container,
                    Id currentPanelId, NavDirection direction);

const char* navDirectionName(NavDirection d);
bool parseNavDirection(const char* name, NavDirection& out);

} // namespace dl
