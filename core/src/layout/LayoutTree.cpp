#include "dl/layout/LayoutTree.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace dl {

namespace {

using LeafFn = std::function<LayoutTree(const Panel&)>;
using NodeFn = std::function<LayoutTree(const LayoutTree&)>;

// Drops Empty children, splices same-axis child splits and collapses a
// single survivor into its parent's slot.
LayoutTree rebuildSplit(SplitDirection dir,
                        const std::vector<LayoutTree>& children,
                        const std::vector<float>& ratios) {
  std::vector<LayoutTree> kept;
  std::vector<float> keptRatios;
  kept.reserve(children.size());
  keptRatios.reserve(children.size());

  for (std::size_t i = 0; i < children.size(); i++) {
    const LayoutTree& c = children[i];
    if (c.isEmpty()) continue;
    if (c.isSplit() && c.direction() == dir) {
      for (std::size_t j = 0; j < c.children().size(); j++) {
        kept.push_back(c.children()[j]);
        keptRatios.push_back(ratios[i] * c.ratios()[j]);
      }
      continue;
    }
    kept.push_back(c);
    keptRatios.push_back(ratios[i]);
  }

  if (kept.empty()) return LayoutTree::empty();
  if (kept.size() == 1) return kept.front();
  return LayoutTree::split(dir, std::move(kept), std::move(keptRatios));
}

// Rewrites the leaf holding panelId. Subtrees off the path are shared by copy.
LayoutTree mapLeaf(const LayoutTree& node, Id panelId, const LeafFn& fn, bool& found) {
  if (node.isEmpty()) return node;
  if (node.isLeaf()) {
    if (node.panel().id != panelId) return node;
    found = true;
    return fn(node.panel());
  }

  std::vector<LayoutTree> children;
  children.reserve(node.children().size());
  for (const auto& c : node.children()) {
    children.push_back(found ? c : mapLeaf(c, panelId, fn, found));
  }
  if (!found) return node;
  return rebuildSplit(node.direction(), children, node.ratios());
}

LayoutTree mapPath(const LayoutTree& node, const LayoutPath& path, std::size_t depth,
                   const NodeFn& fn, bool& reached) {
  if (depth == path.size()) {
    reached = true;
    return fn(node);
  }
  if (!node.isSplit() || path[depth] >= node.children().size()) return node;

  std::vector<LayoutTree> children = node.children();
  children[path[depth]] = mapPath(children[path[depth]], path, depth + 1, fn, reached);
  if (!reached) return node;
  return rebuildSplit(node.direction(), children, node.ratios());
}

void collectPanels(const LayoutTree& node, std::vector<Panel>& out) {
  if (node.isLeaf()) {
    out.push_back(node.panel());
    return;
  }
  for (const auto& c : node.children()) collectPanels(c, out);
}

const Panel* findPanelIf(const LayoutTree& node, const std::function<bool(const Panel&)>& pred) {
  if (node.isLeaf()) return pred(node.panel()) ? &node.panel() : nullptr;
  for (const auto& c : node.children()) {
    if (const Panel* p = findPanelIf(c, pred)) return p;
  }
  return nullptr;
}

bool fail(std::string* why, const std::string& msg) {
  if (why) *why = msg;
  return false;
}

bool validateNode(const LayoutTree& node, bool isRoot,
                  std::unordered_set<Id>& panelIds,
                  std::unordered_set<Id>& tabIds,
                  std::string* why) {
  switch (node.kind()) {
    case NodeKind::Empty:
      return isRoot ? true : fail(why, "empty node below the root");

    case NodeKind::Leaf: {
      const Panel& p = node.panel();
      if (p.id == kInvalidId) return fail(why, "panel with invalid id");
      if (!panelIds.insert(p.id).second)
        return fail(why, "duplicate panel id " + std::to_string(p.id));
      if (p.tabs.empty()) return fail(why, "panel " + std::to_string(p.id) + " has no tabs");
      if (p.activeTabIndex >= p.tabs.size())
        return fail(why, "panel " + std::to_string(p.id) + " active index out of range");
      for (const auto& t : p.tabs) {
        if (t.id == kInvalidId) return fail(why, "tab with invalid id");
        if (!tabIds.insert(t.id).second)
          return fail(why, "duplicate tab id " + std::to_string(t.id));
      }
      return true;
    }

    case NodeKind::Split: {
      const auto& children = node.children();
      const auto& ratios = node.ratios();
      if (children.size() < 2) return fail(why, "split with fewer than two children");
      if (ratios.size() != children.size()) return fail(why, "ratio count mismatch");
      float sum = 0.0f;
      for (float r : ratios) {
        if (!(r > 0.0f) || !std::isfinite(r)) return fail(why, "non-positive ratio");
        sum += r;
      }
      if (std::fabs(sum - 1.0f) > 1e-4f) return fail(why, "ratios do not sum to 1");
      for (const auto& c : children) {
        if (!validateNode(c, false, panelIds, tabIds, why)) return false;
      }
      return true;
    }
  }
  return fail(why, "unknown node kind");
}

} // namespace

// ---------------- construction ----------------

LayoutTree LayoutTree::empty() {
  return LayoutTree{};
}

LayoutTree LayoutTree::leaf(Panel panel) {
  LayoutTree t;
  t.kind_ = NodeKind::Leaf;
  t.panel_ = std::move(panel);
  return t;
}

LayoutTree LayoutTree::split(SplitDirection direction,
                             std::vector<LayoutTree> children,
                             std::vector<float> ratios) {
  if (children.size() < 2)
    throw std::invalid_argument("LayoutTree::split: needs at least two children");
  if (ratios.size() != children.size())
    throw std::invalid_argument("LayoutTree::split: ratio count does not match child count");

  float sum = 0.0f;
  for (float r : ratios) {
    if (!(r > 0.0f) || !std::isfinite(r))
      throw std::invalid_argument("LayoutTree::split: ratios must be positive and finite");
    sum += r;
  }
  for (const auto& c : children) {
    if (c.isEmpty())
      throw std::invalid_argument("LayoutTree::split: empty child");
  }
  // Leave already-normalized ratios bit-exact so persisted layouts round-trip.
  if (std::fabs(sum - 1.0f) > 1e-6f) {
    for (float& r : ratios) r /= sum;
  }

  LayoutTree t;
  t.kind_ = NodeKind::Split;
  t.direction_ = direction;
  t.children_ = std::move(children);
  t.ratios_ = std::move(ratios);
  return t;
}

LayoutTree LayoutTree::split(SplitDirection direction, std::vector<LayoutTree> children) {
  std::vector<float> ratios(children.size(), 1.0f);
  return split(direction, std::move(children), std::move(ratios));
}

const Panel& LayoutTree::panel() const {
  if (kind_ != NodeKind::Leaf) throw std::runtime_error("LayoutTree::panel: not a leaf");
  return panel_;
}

// ---------------- queries ----------------

const Panel* LayoutTree::findPanel(Id panelId) const {
  return findPanelIf(*this, [panelId](const Panel& p) { return p.id == panelId; });
}

const Panel* LayoutTree::findPanelContainingTab(Id tabId) const {
  return findPanelIf(*this, [tabId](const Panel& p) { return p.containsTab(tabId); });
}

std::vector<Panel> LayoutTree::allPanels() const {
  std::vector<Panel> out;
  collectPanels(*this, out);
  return out;
}

std::vector<Tab> LayoutTree::allTabs() const {
  std::vector<Tab> out;
  for (const auto& p : allPanels()) {
    out.insert(out.end(), p.tabs.begin(), p.tabs.end());
  }
  return out;
}

std::size_t LayoutTree::panelCount() const {
  if (isLeaf()) return 1;
  std::size_t n = 0;
  for (const auto& c : children_) n += c.panelCount();
  return n;
}

std::size_t LayoutTree::tabCount() const {
  if (isLeaf()) return panel_.tabs.size();
  std::size_t n = 0;
  for (const auto& c : children_) n += c.tabCount();
  return n;
}

Id LayoutTree::maxPanelId() const {
  Id m = kInvalidId;
  for (const auto& p : allPanels()) m = std::max(m, p.id);
  return m;
}

Id LayoutTree::maxTabId() const {
  Id m = kInvalidId;
  for (const auto& t : allTabs()) m = std::max(m, t.id);
  return m;
}

const LayoutTree* LayoutTree::subtreeAt(const LayoutPath& path) const {
  const LayoutTree* node = this;
  for (std::size_t idx : path) {
    if (!node->isSplit() || idx >= node->children_.size()) return nullptr;
    node = &node->children_[idx];
  }
  return node;
}

// ---------------- transforms ----------------

LayoutTree LayoutTree::removingTab(Id tabId) const {
  const Panel* owner = findPanelContainingTab(tabId);
  if (!owner) return *this;

  bool found = false;
  return mapLeaf(*this, owner->id, [tabId](const Panel& p) {
    Panel next = p.removingTab(tabId);
    return next.isEmpty() ? LayoutTree::empty() : LayoutTree::leaf(std::move(next));
  }, found);
}

LayoutTree LayoutTree::updatingPanel(Id panelId,
                                     const std::function<Panel(const Panel&)>& transform) const {
  bool found = false;
  return mapLeaf(*this, panelId, [&transform](const Panel& p) {
    Panel next = transform(p);
    return next.isEmpty() ? LayoutTree::empty() : LayoutTree::leaf(std::move(next));
  }, found);
}

LayoutTree LayoutTree::replacingPanel(Id panelId, const LayoutTree& replacement) const {
  bool found = false;
  return mapLeaf(*this, panelId, [&replacement](const Panel&) { return replacement; }, found);
}

LayoutTree LayoutTree::splittingPanel(Id targetPanelId, const Panel& newPanel,
                                      DropZoneKind edge, float ratio) const {
  const Panel* target = findPanel(targetPanelId);
  if (!target || !isEdgeZone(edge) || newPanel.isEmpty()) return *this;
  if (newPanel.id == kInvalidId || findPanel(newPanel.id)) return *this;
  for (const auto& t : newPanel.tabs) {
    if (containsTab(t.id)) return *this;
  }

  if (!(ratio > 0.0f && ratio < 1.0f)) ratio = 0.5f;

  std::vector<LayoutTree> children;
  if (edgeInsertsBefore(edge)) {
    children.push_back(LayoutTree::leaf(newPanel));
    children.push_back(LayoutTree::leaf(*target));
  } else {
    children.push_back(LayoutTree::leaf(*target));
    children.push_back(LayoutTree::leaf(newPanel));
  }
  LayoutTree replacement = LayoutTree::split(edgeDirection(edge), std::move(children),
                                             {ratio, 1.0f - ratio});
  return replacingPanel(targetPanelId, replacement);
}

LayoutTree LayoutTree::withRatios(const LayoutPath& path, std::vector<float> ratios) const {
  bool reached = false;
  return mapPath(*this, path, 0, [&ratios](const LayoutTree& node) {
    if (!node.isSplit()) return node;
    return LayoutTree::split(node.direction(), node.children(), ratios);
  }, reached);
}

LayoutTree LayoutTree::resizingDivider(const LayoutPath& path, std::size_t dividerIndex,
                                       float delta, float minRatio) const {
  const LayoutTree* node = subtreeAt(path);
  if (!node || !node->isSplit() || dividerIndex + 1 >= node->children_.size()) return *this;

  std::vector<float> ratios = node->ratios_;
  float& before = ratios[dividerIndex];
  float& after = ratios[dividerIndex + 1];

  // Clamp delta so neither child goes below minRatio
  float maxGrow = std::max(0.0f, after - minRatio);
  float maxShrink = std::max(0.0f, before - minRatio);
  float clampedDelta = std::max(-maxShrink, std::min(delta, maxGrow));
  if (clampedDelta == 0.0f) return *this;

  before += clampedDelta;
  after -= clampedDelta;
  return withRatios(path, std::move(ratios));
}

bool LayoutTree::validate(std::string* why) const {
  std::unordered_set<Id> panelIds;
  std::unordered_set<Id> tabIds;
  return validateNode(*this, true, panelIds, tabIds, why);
}

bool operator==(const LayoutTree& a, const LayoutTree& b) {
  if (a.kind_ != b.kind_) return false;
  switch (a.kind_) {
    case NodeKind::Empty: return true;
    case NodeKind::Leaf:  return a.panel_ == b.panel_;
    case NodeKind::Split:
      return a.direction_ == b.direction_ &&
             a.ratios_ == b.ratios_ &&
             a.children_ == b.children_;
  }
  return false;
}

} // namespace dl
