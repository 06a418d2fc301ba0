#include "dl/layout/BoundsCalculator.hpp"

#include <algorithm>

namespace dl {

namespace {

// Sub-rectangles of `area` for each child of a split.
std::vector<Rect> splitRects(const Rect& area, SplitDirection dir,
                             const std::vector<float>& ratios) {
  std::vector<Rect> out;
  out.reserve(ratios.size());

  const bool horizontal = dir == SplitDirection::Horizontal;
  const float start = horizontal ? area.x : area.y;
  const float length = horizontal ? area.width : area.height;
  const float end = start + length;

  float cursor = start;
  float accumulated = 0.0f;
  for (std::size_t i = 0; i < ratios.size(); i++) {
    float next;
    if (i + 1 == ratios.size()) {
      next = end;  // last child absorbs rounding drift
    } else {
      accumulated += ratios[i];
      next = std::min(end, start + length * accumulated);
    }

    Rect r = area;
    if (horizontal) {
      r.x = cursor;
      r.width = next - cursor;
    } else {
      r.y = cursor;
      r.height = next - cursor;
    }
    out.push_back(r);
    cursor = next;
  }
  return out;
}

void traverse(const LayoutTree& node, const Rect& area, PanelBounds& out) {
  switch (node.kind()) {
    case NodeKind::Empty:
      return;
    case NodeKind::Leaf:
      out[node.panel().id] = area;
      return;
    case NodeKind::Split: {
      std::vector<Rect> rects = splitRects(area, node.direction(), node.ratios());
      for (std::size_t i = 0; i < rects.size(); i++) {
        traverse(node.children()[i], rects[i], out);
      }
      return;
    }
  }
}

void traverseDividers(const LayoutTree& node, const Rect& area, LayoutPath& path,
                      float thickness, std::vector<Divider>& out) {
  if (!node.isSplit()) return;

  std::vector<Rect> rects = splitRects(area, node.direction(), node.ratios());
  const bool horizontal = node.direction() == SplitDirection::Horizontal;
  const float half = thickness * 0.5f;

  for (std::size_t i = 0; i + 1 < rects.size(); i++) {
    Divider d;
    d.path = path;
    d.index = i;
    d.direction = node.direction();
    if (horizontal) {
      d.position = rects[i].right();
      d.extent = area.width;
      d.hitRect = Rect{d.position - half, area.y, thickness, area.height};
    } else {
      d.position = rects[i].bottom();
      d.extent = area.height;
      d.hitRect = Rect{area.x, d.position - half, area.width, thickness};
    }
    out.push_back(d);
  }

  for (std::size_t i = 0; i < rects.size(); i++) {
    path.push_back(i);
    traverseDividers(node.children()[i], rects[i], path, thickness, out);
    path.pop_back();
  }
}

} // namespace

PanelBounds computeBounds(const LayoutTree& tree, const Rect& container) {
  PanelBounds result;
  traverse(tree, container, result);
  return result;
}

PanelBounds computeBounds(const LayoutTree& tree, const Size& container) {
  return computeBounds(tree, Rect{0.0f, 0.0f, container.width, container.height});
}

std::vector<Divider> computeDividers(const LayoutTree& tree, const Rect& container,
                                     float thickness) {
  std::vector<Divider> out;
  LayoutPath path;
  traverseDividers(tree, container, path, thickness, out);
  return out;
}

Rect headerRect(const Rect& frame, float headerHeight) {
  Rect r = frame;
  r.height = std::max(0.0f, std::min(headerHeight, frame.height));
  return r;
}

Rect bodyRect(const Rect& frame, float headerHeight) {
  float h = std::max(0.0f, std::min(headerHeight, frame.height));
  Rect r = frame;
  r.y = frame.y + h;
  r.height = frame.height - h;
  return r;
}

} // namespace dl
