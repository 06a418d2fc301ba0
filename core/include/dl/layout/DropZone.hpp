#pragma once
#include "dl/geometry/Rect.hpp"
#include "dl/ids/Id.hpp"

#include <cstddef>
#include <cstdint>

namespace dl {

enum class SplitDirection : std::uint8_t {
  Horizontal = 1,  // children side by side, divides width
  Vertical = 2     // children stacked, divides height
};

enum class DropZoneKind : std::uint8_t {
  Header = 1,  // insert into the tab strip at insertIndex
  Body,        // target panel has no tabs
  Left,
  Right,
  Top,
  Bottom
};

// Produced fresh on every pointer move; never persisted.
struct DropZone {
  DropZoneKind kind{DropZoneKind::Header};
  Rect highlight;               // UI feedback only
  std::size_t insertIndex{0};   // Header only
};

// What LayoutRestructurer needs to know about a drop.
struct DropTarget {
  Id panelId{kInvalidId};
  DropZoneKind kind{DropZoneKind::Header};
  std::size_t insertIndex{0};
};

// Committed result of a finished drag gesture.
struct DropDecision {
  Id tabId{kInvalidId};
  DropTarget target;
};

inline bool isEdgeZone(DropZoneKind k) {
  return k == DropZoneKind::Left || k == DropZoneKind::Right ||
         k == DropZoneKind::Top || k == DropZoneKind::Bottom;
}

// Left/Right split the width, Top/Bottom the height.
inline SplitDirection edgeDirection(DropZoneKind k) {
  return (k == DropZoneKind::Top || k == DropZoneKind::Bottom)
      ? SplitDirection::Vertical : SplitDirection::Horizontal;
}

// Left/Top place the new leaf before the target.
inline bool edgeInsertsBefore(DropZoneKind k) {
  return k == DropZoneKind::Left || k == DropZoneKind::Top;
}

const char* dropZoneKindName(DropZoneKind k);
// Returns false for unknown names.
bool parseDropZoneKind(const char* name, DropZoneKind& out);

const char* splitDirectionName(SplitDirection d);
bool parseSplitDirection(const char* name, SplitDirection& out);

} // namespace dl
