#include "dl/layout/PanelNavigation.hpp"
#include "dl/layout/BoundsCalculator.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace dl {

namespace {

struct Candidate {
  Id id;
  Rect r;
};

bool isInDirection(const Rect& cand, const Rect& cur, NavDirection dir) {
  switch (dir) {
    case NavDirection::Left:  return cand.midX() < cur.midX();
    case NavDirection::Right: return cand.midX() > cur.midX();
    case NavDirection::Up:    return cand.midY() < cur.midY();
    case NavDirection::Down:  return cand.midY() > cur.midY();
  }
  return false;
}

bool isHorizontal(NavDirection dir) {
  return dir == NavDirection::Left || dir == NavDirection::Right;
}

// Distance along the travel axis; smaller means closer to the current panel.
float travelDistance(const Rect& cand, const Rect& cur, NavDirection dir) {
  switch (dir) {
    case NavDirection::Left:  return cur.left() - cand.right();
    case NavDirection::Right: return cand.left() - cur.right();
    case NavDirection::Up:    return cur.top() - cand.bottom();
    case NavDirection::Down:  return cand.top() - cur.bottom();
  }
  return 0.0f;
}

// The lower bound is inclusive and the upper exclusive so a panel sharing
// only an edge with the scan position does not match.
bool rangeContains(const Rect& cand, float edgePos, NavDirection dir) {
  if (isHorizontal(dir)) return cand.top() <= edgePos && edgePos < cand.bottom();
  return cand.left() <= edgePos && edgePos < cand.right();
}

float rangeDistance(const Rect& cand, float edgePos, NavDirection dir) {
  if (isHorizontal(dir))
    return std::min(std::fabs(cand.top() - edgePos), std::fabs(cand.bottom() - edgePos));
  return std::min(std::fabs(cand.left() - edgePos), std::fabs(cand.right() - edgePos));
}

} // namespace

Id findNearestPanel(const LayoutTree& tree, const Rect& container,
                    Id currentPanelId, NavDirection direction) {
  PanelBounds bounds = computeBounds(tree, container);
  auto curIt = bounds.find(currentPanelId);
  if (curIt == bounds.end()) return kInvalidId;
  const Rect cur = curIt->second;

  // Traversal order keeps ties deterministic.
  std::vector<Candidate> candidates;
  for (const auto& p : tree.allPanels()) {
    if (p.id == currentPanelId) continue;
    const Rect& r = bounds[p.id];
    if (isInDirection(r, cur, direction)) candidates.push_back({p.id, r});
  }
  if (candidates.empty()) return kInvalidId;

  const float edgePos = isHorizontal(direction) ? cur.top() : cur.left();

  std::vector<Candidate> matched;
  for (const auto& c : candidates) {
    if (rangeContains(c.r, edgePos, direction)) matched.push_back(c);
  }

  if (!matched.empty()) {
    auto best = std::min_element(matched.begin(), matched.end(),
      [&](const Candidate& a, const Candidate& b) {
        return travelDistance(a.r, cur, direction) < travelDistance(b.r, cur, direction);
      });
    return best->id;
  }

  // Fallback: closest range edge, then closest along the travel axis
  auto best = std::min_element(candidates.begin(), candidates.end(),
    [&](const Candidate& a, const Candidate& b) {
      float da = rangeDistance(a.r, edgePos, direction);
      float db = rangeDistance(b.r, edgePos, direction);
      if (da != db) return da < db;
      return travelDistance(a.r, cur, direction) < travelDistance(b.r, cur, direction);
    });
  return best->id;
}

const char* navDirectionName(NavDirection d) {
  switch (d) {
    case NavDirection::Left:  return "left";
    case NavDirection::Right: return "right";
    case NavDirection::Up:    return "up";
    case NavDirection::Down:  return "down";
  }
  return "unknown";
}

bool parseNavDirection(const char* name, NavDirection& out) {
  if (!name) return false;
  static const NavDirection kAll[] = {
    NavDirection::Left, NavDirection::Right, NavDirection::Up, NavDirection::Down
  };
  for (NavDirection d : kAll) {
    if (std::strcmp(name, navDirectionName(d)) == 0) {
      out = d;
      return true;
    }
  }
  return false;
}

} // namespace dl
