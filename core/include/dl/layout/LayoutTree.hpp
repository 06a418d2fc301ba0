#pragma once
#include "dl/layout/DropZone.hpp"
#include "dl/layout/Panel.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace dl {

enum class NodeKind : std::uint8_t {
  Empty = 0,  // the whole window lost its last tab
  Leaf = 1,
  Split = 2
};

// Child indices from the root down to a node.
using LayoutPath = std::vector<std::size_t>;

// Immutable panel hierarchy. Every transform returns a new tree and leaves
// the receiver untouched; "not found" transforms return an equal tree.
//
// Rebuilt splits are normalized: empty children are dropped (their share is
// redistributed proportionally), a single remaining child replaces the split,
// and a child split running along the parent's axis is spliced into the
// parent. Normalization never changes panel geometry.
class LayoutTree {
public:
  LayoutTree() = default;

  static LayoutTree empty();
  static LayoutTree leaf(Panel panel);

  // Throws std::invalid_argument on fewer than two children, ratio count
  // mismatch, non-positive or non-finite ratios, or an Empty child.
  // Ratios are renormalized to sum to 1.
  static LayoutTree split(SplitDirection direction,
                          std::vector<LayoutTree> children,
                          std::vector<float> ratios);
  // Equal shares.
  static LayoutTree split(SplitDirection direction, std::vector<LayoutTree> children);

  NodeKind kind() const { return kind_; }
  bool isEmpty() const { return kind_ == NodeKind::Empty; }
  bool isLeaf() const { return kind_ == NodeKind::Leaf; }
  bool isSplit() const { return kind_ == NodeKind::Split; }

  // Leaf only; throws std::runtime_error otherwise.
  const Panel& panel() const;

  // Split only (meaningless on other kinds).
  SplitDirection direction() const { return direction_; }
  const std::vector<LayoutTree>& children() const { return children_; }
  const std::vector<float>& ratios() const { return ratios_; }

  // ---- queries ----
  const Panel* findPanel(Id panelId) const;
  const Panel* findPanelContainingTab(Id tabId) const;
  bool containsTab(Id tabId) const { return findPanelContainingTab(tabId) != nullptr; }

  // Left-to-right, depth-first. Order is the hit-testing priority.
  std::vector<Panel> allPanels() const;
  std::vector<Tab> allTabs() const;
  std::size_t panelCount() const;
  std::size_t tabCount() const;
  Id maxPanelId() const;
  Id maxTabId() const;

  // nullptr when the path leaves the tree.
  const LayoutTree* subtreeAt(const LayoutPath& path) const;

  // ---- transforms ----
  LayoutTree removingTab(Id tabId) const;
  LayoutTree updatingPanel(Id panelId, const std::function<Panel(const Panel&)>& transform) const;
  LayoutTree replacingPanel(Id panelId, const LayoutTree& replacement) const;

  // Places newPanel beside the target the way an edge drop would. `ratio` is
  // the first child's share. Unchanged if the target is missing, `edge` is not
  // an edge kind, or newPanel is empty or collides with existing ids.
  LayoutTree splittingPanel(Id targetPanelId, const Panel& newPanel,
                            DropZoneKind edge, float ratio = 0.5f) const;

  // Unchanged when the path does not name a split. Bad ratios throw as in split().
  LayoutTree withRatios(const LayoutPath& path, std::vector<float> ratios) const;

  // Moves `delta` of the split's share from child dividerIndex+1 to child
  // dividerIndex, keeping both at or above minRatio.
  LayoutTree resizingDivider(const LayoutPath& path, std::size_t dividerIndex,
                             float delta, float minRatio) const;

  // True if every structural invariant holds; otherwise fills `why`.
  bool validate(std::string* why = nullptr) const;

private:
  NodeKind kind_{NodeKind::Empty};
  Panel panel_;
  SplitDirection direction_{SplitDirection::Horizontal};
  std::vector<LayoutTree> children_;
  std::vector<float> ratios_;

  friend bool operator==(const LayoutTree& a, const LayoutTree& b);
};

bool operator==(const LayoutTree& a, const LayoutTree& b);
inline bool operator!=(const LayoutTree& a, const LayoutTree& b) { return !(a == b); }

} // namespace dl
