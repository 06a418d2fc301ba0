#include "dl/layout/LayoutRestructurer.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace dl {

namespace {

LayoutTree dropOnHeader(const LayoutTree& tree, const Panel& source, const Panel& target,
                        const Tab& tab, std::size_t insertIndex) {
  std::size_t index = std::min(insertIndex, target.tabs.size());

  if (source.id == target.id) {
    // Removing the tab first shifts every slot after it one to the left.
    std::size_t from = source.indexOf(tab.id);
    if (from < index) index -= 1;
    if (index == from) return tree;

    std::vector<Id> order;
    order.reserve(source.tabs.size());
    for (const auto& t : source.tabs) {
      if (t.id != tab.id) order.push_back(t.id);
    }
    order.insert(order.begin() + static_cast<std::ptrdiff_t>(index), tab.id);

    return tree.updatingPanel(target.id, [&tab, &order](const Panel& p) {
      return p.reorderingTabs(order).activatingTab(tab.id);
    });
  }

  LayoutTree without = tree.removingTab(tab.id);
  return without.updatingPanel(target.id, [&tab, index](const Panel& p) {
    return p.addingTab(tab, index);
  });
}

LayoutTree dropOnBody(const LayoutTree& tree, const Panel& target, const Tab& tab) {
  if (!target.isEmpty()) return tree;

  LayoutTree without = tree.removingTab(tab.id);
  return without.updatingPanel(target.id, [&tab](const Panel& p) {
    return p.addingTab(tab);
  });
}

LayoutTree dropOnEdge(const LayoutTree& tree, const Panel& source, const Panel& target,
                      const Tab& tab, DropZoneKind edge, const RestructureConfig& cfg) {
  const bool sourceEmptied = source.tabs.size() == 1;
  if (sourceEmptied && source.id == target.id) return tree;

  Panel fresh;
  fresh.id = sourceEmptied ? source.id : tree.maxPanelId() + 1;
  fresh.tabs.push_back(tab);
  fresh.activeTabIndex = 0;

  float ratio = cfg.splitRatio;
  if (!(ratio > 0.0f && ratio < 1.0f)) ratio = 0.5f;
  // splittingPanel takes the first child's share
  float firstShare = edgeInsertsBefore(edge) ? ratio : 1.0f - ratio;

  LayoutTree without = tree.removingTab(tab.id);
  return without.splittingPanel(target.id, fresh, edge, firstShare);
}

} // namespace

LayoutTree restructure(const LayoutTree& tree, Id tabId, const DropTarget& drop,
                       const RestructureConfig& cfg) {
  const Panel* source = tree.findPanelContainingTab(tabId);
  const Panel* target = tree.findPanel(drop.panelId);
  if (!source || !target) return tree;

  const Tab tab = source->tabs[source->indexOf(tabId)];

  switch (drop.kind) {
    case DropZoneKind::Header:
      return dropOnHeader(tree, *source, *target, tab, drop.insertIndex);
    case DropZoneKind::Body:
      return dropOnBody(tree, *target, tab);
    case DropZoneKind::Left:
    case DropZoneKind::Right:
    case DropZoneKind::Top:
    case DropZoneKind::Bottom:
      return dropOnEdge(tree, *source, *target, tab, drop.kind, cfg);
  }
  return tree;
}

} // namespace dl
