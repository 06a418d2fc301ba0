#include "dl/layout/DropZone.hpp"

#include <cstring>

namespace dl {

const char* dropZoneKindName(DropZoneKind k) {
  switch (k) {
    case DropZoneKind::Header: return "header";
    case DropZoneKind::Body:   return "body";
    case DropZoneKind::Left:   return "left";
    case DropZoneKind::Right:  return "right";
    case DropZoneKind::Top:    return "top";
    case DropZoneKind::Bottom: return "bottom";
  }
  return "unknown";
}

bool parseDropZoneKind(const char* name, DropZoneKind& out) {
  if (!name) return false;
  static const DropZoneKind kAll[] = {
    DropZoneKind::Header, DropZoneKind::Body, DropZoneKind::Left,
    DropZoneKind::Right, DropZoneKind::Top, DropZoneKind::Bottom
  };
  for (DropZoneKind k : kAll) {
    if (std::strcmp(name, dropZoneKindName(k)) == 0) {
      out = k;
      return true;
    }
  }
  return false;
}

const char* splitDirectionName(SplitDirection d) {
  return d == SplitDirection::Vertical ? "vertical" : "horizontal";
}

bool parseSplitDirection(const char* name, SplitDirection& out) {
  if (!name) return false;
  if (std::strcmp(name, "horizontal") == 0) { out = SplitDirection::Horizontal; return true; }
  if (std::strcmp(name, "vertical") == 0) { out = SplitDirection::Vertical; return true; }
  return false;
}

} // namespace dl
