#pragma once
#include "dl/geometry/Rect.hpp"
#include "dl/layout/DropZone.hpp"
#include "dl/layout/Panel.hpp"
#include "dl/layout/TabStrip.hpp"

namespace dl {

struct DropZoneConfig {
  float hoverRatio{0.25f};      // edge band depth used for classification
  float highlightRatio{0.5f};   // edge strip depth of the feedback rectangle
};

// Classifies `pointer` against one panel. Priority:
//   1. inside header          -> Header, insertIndex from the tab slots
//   2. empty panel, in body   -> Body
//   3. edge hover bands       -> Left / Right (checked first), Top / Bottom
// Returns false for the unclassified centre or a pointer outside the body.
bool computeDropZone(const Panel& panel,
                     const Rect& body,
                     const Rect& header,
                     const Point& pointer,
                     const DropZoneConfig& cfg,
                     const TabStripConfig& tabCfg,
                     DropZone& out);

} // namespace dl
