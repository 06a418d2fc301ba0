// D6.2 - Directional panel navigation (pure C++)
// Tests: neighbours in all four directions, nothing beyond the container
// edge, nearest candidate along the travel axis, unknown panel, names.

#include "dl/layout/PanelNavigation.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static dl::LayoutTree leafOf(dl::Id id) {
  dl::Panel p;
  p.id = id;
  p.tabs.push_back(dl::Tab{id, "t", 0});
  return dl::LayoutTree::leaf(p);
}

int main() {
  using dl::NavDirection;
  const dl::Rect container{0, 0, 800, 600};

  // P1 | (P2 / P3)
  const dl::LayoutTree tree = dl::LayoutTree::split(dl::SplitDirection::Horizontal, {
      leafOf(1),
      dl::LayoutTree::split(dl::SplitDirection::Vertical, {leafOf(2), leafOf(3)})});

  // --- Test 1: neighbours ---
  {
    requireTrue(dl::findNearestPanel(tree, container, 1, NavDirection::Right) == 2,
                "P1 right -> P2 (top edge aligned)");
    requireTrue(dl::findNearestPanel(tree, container, 3, NavDirection::Left) == 1, "P3 left -> P1");
    requireTrue(dl::findNearestPanel(tree, container, 2, NavDirection::Left) == 1, "P2 left -> P1");
    requireTrue(dl::findNearestPanel(tree, container, 2, NavDirection::Down) == 3, "P2 down -> P3");
    requireTrue(dl::findNearestPanel(tree, container, 3, NavDirection::Up) == 2, "P3 up -> P2");
    std::printf("  Test 1 (neighbours) PASS\n");
  }

  // --- Test 2: nothing past the edge ---
  {
    requireTrue(dl::findNearestPanel(tree, container, 1, NavDirection::Left) == dl::kInvalidId,
                "nothing left of P1");
    requireTrue(dl::findNearestPanel(tree, container, 2, NavDirection::Up) == dl::kInvalidId,
                "nothing above P2");
    requireTrue(dl::findNearestPanel(tree, container, 3, NavDirection::Right) == dl::kInvalidId,
                "nothing right of P3");
    std::printf("  Test 2 (edges) PASS\n");
  }

  // --- Test 3: centre-only candidates fall back to the closest range ---
  {
    // P3's centre lies below P1's, but its column does not contain P1's left edge
    requireTrue(dl::findNearestPanel(tree, container, 1, NavDirection::Down) == 3,
                "P1 down falls back to P3");
    requireTrue(dl::findNearestPanel(tree, container, 1, NavDirection::Up) == 2,
                "P1 up falls back to P2");
    std::printf("  Test 3 (fallback) PASS\n");
  }

  // --- Test 4: nearest along the travel axis ---
  {
    dl::LayoutTree row = dl::LayoutTree::split(dl::SplitDirection::Horizontal,
                                               {leafOf(1), leafOf(2), leafOf(3)});
    requireTrue(dl::findNearestPanel(row, container, 3, NavDirection::Left) == 2, "P3 left -> P2");
    requireTrue(dl::findNearestPanel(row, container, 1, NavDirection::Right) == 2, "P1 right -> P2");
    std::printf("  Test 4 (nearest) PASS\n");
  }

  // --- Test 5: the leading edge picks among stacked candidates ---
  {
    // (P1 / P2) | (P3 / P4) with the right column split at 25%
    dl::LayoutTree grid = dl::LayoutTree::split(dl::SplitDirection::Horizontal, {
        dl::LayoutTree::split(dl::SplitDirection::Vertical, {leafOf(1), leafOf(2)}),
        dl::LayoutTree::split(dl::SplitDirection::Vertical, {leafOf(3), leafOf(4)},
                              {0.25f, 0.75f})});
    requireTrue(dl::findNearestPanel(grid, container, 2, NavDirection::Right) == 4,
                "P2 top edge (y=300) lies in P4");
    requireTrue(dl::findNearestPanel(grid, container, 1, NavDirection::Right) == 3,
                "P1 top edge (y=0) lies in P3");
    requireTrue(dl::findNearestPanel(grid, container, 4, NavDirection::Left) == 1,
                "P4 top edge (y=150) lies in P1");
    std::printf("  Test 5 (leading edge) PASS\n");
  }

  // --- Test 6: unknown panel and names ---
  {
    requireTrue(dl::findNearestPanel(tree, container, 99, NavDirection::Right) == dl::kInvalidId,
                "unknown current panel");
    requireTrue(dl::findNearestPanel(dl::LayoutTree::empty(), container, 1, NavDirection::Up) ==
                dl::kInvalidId, "empty tree");

    NavDirection d;
    requireTrue(dl::parseNavDirection("down", d) && d == NavDirection::Down, "parse down");
    requireTrue(!dl::parseNavDirection("sideways", d), "reject unknown");
    requireTrue(std::strcmp(dl::navDirectionName(NavDirection::Left), "left") == 0, "name");
    std::printf("  Test 6 (misc) PASS\n");
  }

  std::printf("D6.2 navigation: ALL PASS\n");
  return 0;
}
