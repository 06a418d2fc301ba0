// D5.1 - DragSession state machine (pure C++)
// Tests: phase transitions, hover tracking and change reporting, header
// hover, shared-edge tie break, scale, end without hover, cancel.

#include "dl/layout/DragSession.hpp"
#include "dl/layout/LayoutRestructurer.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  using dl::DragPhase;
  using dl::DropZoneKind;

  // H[P1[A(1), B(2)], P2[C(3)]] in 800x600: P1 = [0,400], P2 = [400,800]
  dl::Panel p1;
  p1.id = 1;
  p1.tabs = {dl::Tab{1, "A", 0}, dl::Tab{2, "B", 0}};
  dl::Panel p2;
  p2.id = 2;
  p2.tabs = {dl::Tab{3, "C", 0}};
  const dl::LayoutTree tree = dl::LayoutTree::split(
      dl::SplitDirection::Horizontal, {dl::LayoutTree::leaf(p1), dl::LayoutTree::leaf(p2)});
  const dl::Size container{800, 600};

  // --- Test 1: Idle -> Dragging, second start rejected ---
  {
    dl::DragSession s;
    requireTrue(s.phase() == DragPhase::Idle, "starts idle");
    requireTrue(s.startDrag(p1.tabs[0], 1), "start accepted");
    requireTrue(s.isDragging(), "dragging");
    requireTrue(s.draggedTab().id == 1 && s.sourcePanelId() == 1, "drag payload");
    requireTrue(!s.startDrag(p1.tabs[1], 1), "second start rejected");
    requireTrue(s.draggedTab().id == 1, "payload unchanged");
    std::printf("  Test 1 (start) PASS\n");
  }

  // --- Test 2: hover changes are reported once ---
  {
    dl::DragSession s;
    requireTrue(!s.updatePosition(dl::Point{790, 300}, tree, container), "idle ignores moves");

    s.startDrag(p1.tabs[0], 1);
    requireTrue(!s.updatePosition(dl::Point{600, 300}, tree, container), "centre: no hover");
    requireTrue(!s.hasHover(), "no hover in the centre");

    requireTrue(s.updatePosition(dl::Point{790, 300}, tree, container), "entered right band");
    requireTrue(s.hasHover() && s.hover().panelId == 2, "hover on P2");
    requireTrue(s.hover().zone.kind == DropZoneKind::Right, "right zone");

    requireTrue(!s.updatePosition(dl::Point{791, 310}, tree, container), "same target");
    requireTrue(s.updatePosition(dl::Point{600, 300}, tree, container), "left the band");
    requireTrue(!s.hasHover(), "hover cleared");
    requireTrue(s.pointer().x == 600, "pointer tracked");
    std::printf("  Test 2 (hover tracking) PASS\n");
  }

  // --- Test 3: header hover and insertion index ---
  {
    dl::DragSession s;
    s.startDrag(p1.tabs[0], 1);
    requireTrue(s.updatePosition(dl::Point{420, 10}, tree, container), "header hover");
    requireTrue(s.hover().zone.kind == DropZoneKind::Header, "header zone");
    requireTrue(s.hover().zone.insertIndex == 0, "before C");

    requireTrue(s.updatePosition(dl::Point{470, 10}, tree, container), "index change reported");
    requireTrue(s.hover().zone.insertIndex == 1, "after C");
    std::printf("  Test 3 (header) PASS\n");
  }

  // --- Test 4: shared edge belongs to the first panel visited ---
  {
    dl::DragSession s;
    s.startDrag(p2.tabs[0], 2);
    s.updatePosition(dl::Point{400, 300}, tree, container);
    requireTrue(s.hasHover() && s.hover().panelId == 1, "P1 wins the shared edge");
    requireTrue(s.hover().zone.kind == DropZoneKind::Right, "right edge of P1");
    std::printf("  Test 4 (shared edge) PASS\n");
  }

  // --- Test 5: endDrag yields a decision that restructures ---
  {
    dl::DragSession s;
    s.startDrag(p1.tabs[0], 1);
    s.updatePosition(dl::Point{790, 300}, tree, container);

    dl::DropDecision d;
    requireTrue(s.endDrag(d), "decision produced");
    requireTrue(s.phase() == DragPhase::Ended, "ended");
    requireTrue(d.tabId == 1 && d.target.panelId == 2 &&
                d.target.kind == DropZoneKind::Right, "decision contents");

    dl::LayoutTree r = dl::applyDrop(tree, d);
    requireTrue(r.children().size() == 3, "flattened three-way split");
    requireTrue(r.children()[2].panel().id == 3 && r.children()[2].panel().tabs[0].id == 1,
                "A in a new panel on the right");

    requireTrue(!s.startDrag(p1.tabs[0], 1), "nothing leaves Ended");
    requireTrue(!s.endDrag(d), "second end rejected");
    std::printf("  Test 5 (end with hover) PASS\n");
  }

  // --- Test 6: endDrag without hover ---
  {
    dl::DragSession s;
    s.startDrag(p1.tabs[0], 1);
    s.updatePosition(dl::Point{2000, 2000}, tree, container);
    requireTrue(!s.hasHover(), "outside the container");

    dl::DropDecision d;
    d.tabId = 77;
    requireTrue(!s.endDrag(d), "no decision");
    requireTrue(d.tabId == 77, "decision untouched");
    requireTrue(s.phase() == DragPhase::Ended, "still ended");
    std::printf("  Test 6 (end without hover) PASS\n");
  }

  // --- Test 7: cancel returns to Idle ---
  {
    dl::DragSession s;
    s.cancelDrag();
    requireTrue(s.phase() == DragPhase::Idle, "cancel in idle is harmless");

    s.startDrag(p1.tabs[0], 1);
    s.updatePosition(dl::Point{790, 300}, tree, container);
    s.cancelDrag();
    requireTrue(s.phase() == DragPhase::Idle && !s.hasHover(), "cancelled");
    requireTrue(s.startDrag(p1.tabs[1], 1), "can start again");
    std::printf("  Test 7 (cancel) PASS\n");
  }

  // --- Test 8: scale enlarges the header band ---
  {
    dl::DragSessionConfig cfg;
    cfg.scale = 2.0f;
    dl::DragSession s(cfg);
    s.startDrag(p1.tabs[0], 1);
    s.updatePosition(dl::Point{420, 50}, tree, container);
    requireTrue(s.hasHover() && s.hover().zone.kind == DropZoneKind::Header,
                "y=50 is inside a 60px header");

    dl::DragSession plain;
    plain.startDrag(p1.tabs[0], 1);
    plain.updatePosition(dl::Point{420, 50}, tree, container);
    requireTrue(plain.hasHover() && plain.hover().zone.kind != DropZoneKind::Header,
                "y=50 is body with a 30px header");
    requireTrue(std::string(dl::dragPhaseName(plain.phase())) == "dragging", "phase name");
    std::printf("  Test 8 (scale) PASS\n");
  }

  std::printf("D5.1 drag session: ALL PASS\n");
  return 0;
}
