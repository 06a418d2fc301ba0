#include "dl/layout/DropZoneCalculator.hpp"

#include <algorithm>
#include <vector>

namespace dl {

bool computeDropZone(const Panel& panel,
                     const Rect& body,
                     const Rect& header,
                     const Point& pointer,
                     const DropZoneConfig& cfg,
                     const TabStripConfig& tabCfg,
                     DropZone& out) {
  // 1. Header strip: insert between tabs
  if (header.height > 0.0f && header.contains(pointer)) {
    std::vector<Rect> slots = computeTabSlots(panel, header, tabCfg);
    out.kind = DropZoneKind::Header;
    out.highlight = header;
    out.insertIndex = std::min(insertionIndexAt(slots, pointer.x), panel.tabs.size());
    return true;
  }

  if (!body.contains(pointer)) return false;

  // 2. Empty panel: the whole body accepts the tab
  if (panel.isEmpty()) {
    out.kind = DropZoneKind::Body;
    out.highlight = body;
    out.insertIndex = 0;
    return true;
  }

  // 3. Edge bands. Left/right take the corners.
  const float w = body.width;
  const float h = body.height;
  const float dx = pointer.x - body.x;
  const float dy = pointer.y - body.y;
  const float hover = cfg.hoverRatio;
  const float highlight = cfg.highlightRatio;

  DropZone z;
  if (dx < w * hover) {
    z.kind = DropZoneKind::Left;
    z.highlight = Rect{body.x, body.y, w * highlight, h};
    out = z;
    return true;
  }
  if (w - dx < w * hover) {
    z.kind = DropZoneKind::Right;
    z.highlight = Rect{body.right() - w * highlight, body.y, w * highlight, h};
    out = z;
    return true;
  }
  if (dy < h * hover) {
    z.kind = DropZoneKind::Top;
    z.highlight = Rect{body.x, body.y, w, h * highlight};
    out = z;
    return true;
  }
  if (h - dy < h * hover) {
    z.kind = DropZoneKind::Bottom;
    z.highlight = Rect{body.x, body.bottom() - h * highlight, w, h * highlight};
    out = z;
    return true;
  }

  // Centre: no drop zone here
  return false;
}

} // namespace dl
