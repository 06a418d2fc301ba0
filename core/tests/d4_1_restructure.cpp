// D4.1 - LayoutRestructurer (pure C++)
// Tests: the three drop scenarios, same-panel no-ops, body drops, edge drops
// that move or create panels, axis flattening, split ratio, tab
// preservation across a sequence of moves.

#include "dl/layout/LayoutRestructurer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(float a, float b, float eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

// Tab ids 1..n are titled "A", "B", ...
static dl::LayoutTree leafOf(dl::Id id, std::initializer_list<dl::Id> tabIds,
                             std::size_t active = 0) {
  dl::Panel p;
  p.id = id;
  for (dl::Id t : tabIds) {
    p.tabs.push_back(dl::Tab{t, std::string(1, static_cast<char>('A' + t - 1)), t});
  }
  p.activeTabIndex = active;
  return dl::LayoutTree::leaf(p);
}

static std::vector<dl::Id> sortedTabIds(const dl::LayoutTree& t) {
  std::vector<dl::Id> ids;
  for (const auto& tab : t.allTabs()) ids.push_back(tab.id);
  std::sort(ids.begin(), ids.end());
  return ids;
}

int main() {
  using dl::DropZoneKind;
  using dl::LayoutTree;
  using dl::SplitDirection;

  const dl::Id A = 1, B = 2, C = 3, D = 4;

  // --- Test 1: B onto the left edge of its own panel ---
  {
    LayoutTree t = leafOf(1, {A, B}, 1);
    LayoutTree r = dl::restructure(t, B, dl::DropTarget{1, DropZoneKind::Left, 0});

    requireTrue(r.isSplit() && r.direction() == SplitDirection::Horizontal, "horizontal split");
    requireTrue(r.children().size() == 2, "two children");
    requireClose(r.ratios()[0], 0.5f, 1e-6f, "half");
    const dl::Panel& left = r.children()[0].panel();
    const dl::Panel& right = r.children()[1].panel();
    requireTrue(left.id == 2 && left.tabs.size() == 1 && left.tabs[0].id == B, "new panel 2 holds B");
    requireTrue(right.id == 1 && right.tabs.size() == 1 && right.tabs[0].id == A, "panel 1 keeps A");
    requireTrue(r.validate(), "valid");
    std::printf("  Test 1 (split own panel) PASS\n");
  }

  // --- Test 2: same-panel header moves that change nothing ---
  {
    LayoutTree t = leafOf(1, {A, B});
    requireTrue(dl::restructure(t, A, dl::DropTarget{1, DropZoneKind::Header, 0}) == t,
                "A to index 0 is a no-op");
    requireTrue(dl::restructure(t, A, dl::DropTarget{1, DropZoneKind::Header, 1}) == t,
                "A to index 1 is a no-op");

    LayoutTree r = dl::restructure(t, A, dl::DropTarget{1, DropZoneKind::Header, 2});
    requireTrue(r.panel().tabs[0].id == B && r.panel().tabs[1].id == A, "A moved to the end");
    requireTrue(r.panel().activeTab()->id == A, "moved tab active");

    LayoutTree back = dl::restructure(r, A, dl::DropTarget{1, DropZoneKind::Header, 0});
    requireTrue(back.panel().tabs[0].id == A, "A moved back to the front");

    LayoutTree clamped = dl::restructure(t, A, dl::DropTarget{1, DropZoneKind::Header, 99});
    requireTrue(clamped == r, "index clamped to the end");

    // B active; C lands between A and B and takes focus
    LayoutTree three = leafOf(1, {A, B, C}, 1);
    LayoutTree mid = dl::restructure(three, C, dl::DropTarget{1, DropZoneKind::Header, 1});
    const dl::Panel& mp = mid.panel();
    requireTrue(mp.tabs.size() == 3, "no tab lost");
    requireTrue(mp.tabs[0].id == A && mp.tabs[1].id == C && mp.tabs[2].id == B, "C in the middle");
    requireTrue(mp.tabs[1].title == "C" && mp.tabs[1].content == C, "C moved intact");
    requireTrue(mp.activeTab()->id == C, "dragged tab active");
    std::printf("  Test 2 (same-panel header) PASS\n");
  }

  // --- Test 3: A into P2's header at index 1, P1 disappears ---
  {
    LayoutTree t = LayoutTree::split(SplitDirection::Horizontal, {leafOf(1, {A}), leafOf(2, {B})});
    LayoutTree r = dl::restructure(t, A, dl::DropTarget{2, DropZoneKind::Header, 1});
    requireTrue(r.isLeaf(), "collapsed to a leaf");
    requireTrue(r.panel().id == 2, "panel 2 survives");
    requireTrue(r.panel().tabs.size() == 2 && r.panel().tabs[0].id == B &&
                r.panel().tabs[1].id == A, "[B, A]");
    requireTrue(r.panel().activeTabIndex == 1, "A active");
    std::printf("  Test 3 (cross-panel header) PASS\n");
  }

  // --- Test 4: preconditions and body drops ---
  {
    LayoutTree t = LayoutTree::split(SplitDirection::Horizontal, {leafOf(1, {A}), leafOf(2, {B})});
    requireTrue(dl::restructure(t, 42, dl::DropTarget{2, DropZoneKind::Header, 0}) == t,
                "unknown tab");
    requireTrue(dl::restructure(t, A, dl::DropTarget{9, DropZoneKind::Left, 0}) == t,
                "unknown panel");
    requireTrue(dl::restructure(t, A, dl::DropTarget{2, DropZoneKind::Body, 0}) == t,
                "body of a non-empty panel");
    requireTrue(dl::restructure(t, A, dl::DropTarget{1, DropZoneKind::Right, 0}) == t,
                "sole tab onto its own edge");
    std::printf("  Test 4 (no-ops) PASS\n");
  }

  // --- Test 5: edge drop that empties the source moves the panel ---
  {
    LayoutTree t = LayoutTree::split(SplitDirection::Horizontal, {leafOf(1, {A}), leafOf(2, {B})});
    LayoutTree r = dl::restructure(t, A, dl::DropTarget{2, DropZoneKind::Bottom, 0});
    requireTrue(r.isSplit() && r.direction() == SplitDirection::Vertical, "vertical split");
    requireTrue(r.children()[0].panel().id == 2, "target on top");
    requireTrue(r.children()[1].panel().id == 1, "moved panel keeps its id");
    requireTrue(r.children()[1].panel().tabs[0].id == A, "moved panel holds A");
    std::printf("  Test 5 (panel move) PASS\n");
  }

  // --- Test 6: same-axis edge drop flattens ---
  {
    LayoutTree t = LayoutTree::split(SplitDirection::Horizontal,
                                     {leafOf(1, {A, C}), leafOf(2, {B})});
    LayoutTree r = dl::restructure(t, C, dl::DropTarget{2, DropZoneKind::Right, 0});
    requireTrue(r.children().size() == 3, "three siblings");
    requireClose(r.ratios()[0], 0.5f, 1e-6f, "P1 untouched");
    requireClose(r.ratios()[1], 0.25f, 1e-6f, "target halved");
    requireClose(r.ratios()[2], 0.25f, 1e-6f, "new half");
    requireTrue(r.children()[2].panel().id == 3, "next free panel id");

    LayoutTree perp = dl::restructure(t, C, dl::DropTarget{2, DropZoneKind::Top, 0});
    requireTrue(perp.children().size() == 2, "perpendicular keeps two");
    const LayoutTree& nested = perp.children()[1];
    requireTrue(nested.isSplit() && nested.direction() == SplitDirection::Vertical, "nested vertical");
    requireTrue(nested.children()[0].panel().id == 3, "new panel above");
    std::printf("  Test 6 (flattening) PASS\n");
  }

  // --- Test 7: configured split ratio goes to the new panel ---
  {
    dl::RestructureConfig cfg;
    cfg.splitRatio = 0.3f;
    LayoutTree t = leafOf(1, {A, B});

    LayoutTree right = dl::restructure(t, B, dl::DropTarget{1, DropZoneKind::Right, 0}, cfg);
    requireClose(right.ratios()[0], 0.7f, 1e-6f, "target keeps 70%");
    requireClose(right.ratios()[1], 0.3f, 1e-6f, "new panel 30% on the right");

    LayoutTree top = dl::restructure(t, B, dl::DropTarget{1, DropZoneKind::Top, 0}, cfg);
    requireClose(top.ratios()[0], 0.3f, 1e-6f, "new panel 30% on top");
    std::printf("  Test 7 (split ratio) PASS\n");
  }

  // --- Test 8: tabs are preserved across a sequence of moves ---
  {
    LayoutTree t = LayoutTree::split(SplitDirection::Horizontal,
                                     {leafOf(1, {A, B}), leafOf(2, {C, D})});
    const std::vector<dl::Id> expected = sortedTabIds(t);

    struct Move { dl::Id tab; dl::DropTarget target; };
    const Move moves[] = {
      {A, {2, DropZoneKind::Left, 0}},
      {D, {1, DropZoneKind::Bottom, 0}},
      {B, {3, DropZoneKind::Header, 0}},
      {C, {3, DropZoneKind::Top, 0}},
      {D, {2, DropZoneKind::Header, 5}},
      {A, {1, DropZoneKind::Right, 0}},
      {B, {4, DropZoneKind::Header, 1}},
    };

    for (const auto& m : moves) {
      // Retarget moves whose panel has disappeared to the first panel
      dl::DropTarget target = m.target;
      if (!t.findPanel(target.panelId)) target.panelId = t.allPanels().front().id;

      t = dl::restructure(t, m.tab, target);
      std::string why;
      if (!t.validate(&why)) {
        std::fprintf(stderr, "invalid tree: %s\n", why.c_str());
        requireTrue(false, "tree stays valid");
      }
      requireTrue(sortedTabIds(t) == expected, "tab set preserved");
    }
    std::printf("  Test 8 (tab preservation) PASS\n");
  }

  // --- Test 9: applyDrop forwards the decision ---
  {
    LayoutTree t = LayoutTree::split(SplitDirection::Horizontal, {leafOf(1, {A}), leafOf(2, {B})});
    dl::DropDecision d;
    d.tabId = A;
    d.target = dl::DropTarget{2, DropZoneKind::Header, 1};
    requireTrue(dl::applyDrop(t, d) == dl::restructure(t, A, d.target), "same result");
    std::printf("  Test 9 (applyDrop) PASS\n");
  }

  // --- Test 10: body drop onto an empty panel ---
  {
    LayoutTree t = LayoutTree::split(SplitDirection::Horizontal,
                                     {leafOf(1, {A, B}, 1), leafOf(2, {})});
    LayoutTree r = dl::restructure(t, A, dl::DropTarget{2, DropZoneKind::Body, 0});
    requireTrue(r != t, "body drop applied");
    const dl::Panel* p2 = r.findPanel(2);
    requireTrue(p2 && p2->tabs.size() == 1, "target holds one tab");
    requireTrue(p2->tabs[0].id == A && p2->tabs[0].title == "A", "dragged tab moved intact");
    requireTrue(p2->activeTab() && p2->activeTab()->id == A, "dragged tab active");
    const dl::Panel* p1 = r.findPanel(1);
    requireTrue(p1 && p1->tabs.size() == 1 && p1->tabs[0].id == B, "source keeps B");
    requireTrue(r.validate(), "result valid");

    // Moving the source's only tab prunes the source panel
    LayoutTree single = LayoutTree::split(SplitDirection::Vertical,
                                          {leafOf(1, {A}), leafOf(2, {})});
    LayoutTree moved = dl::restructure(single, A, dl::DropTarget{2, DropZoneKind::Body, 0});
    requireTrue(moved.isLeaf(), "split collapsed to the target");
    requireTrue(moved.panel().id == 2, "target panel survives");
    requireTrue(moved.panel().tabs.size() == 1 && moved.panel().tabs[0].id == A, "target holds A");
    requireTrue(!moved.findPanel(1), "source pruned");
    requireTrue(moved.validate(), "collapsed result valid");
    std::printf("  Test 10 (body drop on empty panel) PASS\n");
  }

  std::printf("D4.1 restructure: ALL PASS\n");
  return 0;
}
