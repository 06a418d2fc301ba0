#include "dl/session/LayoutSession.hpp"
#include "dl/layout/LayoutRestructurer.hpp"
#include "dl/serial/LayoutSerializer.hpp"

#include <cstdio>
#include <utility>

namespace dl {

LayoutSession::LayoutSession(const EngineConfig& cfg) {
  setConfig(cfg);
  dividers_.setContainer(containerRect());
}

void LayoutSession::setConfig(const EngineConfig& cfg) {
  config_ = cfg;
  dividers_.setConfig(dividerConfig(config_));
  if (drag_) drag_->setConfig(dragSessionConfig(config_, scale_));
}

void LayoutSession::setContainer(const Size& size, float scale) {
  container_ = size;
  scale_ = scale > 0.0f ? scale : 1.0f;
  dividers_.setContainer(containerRect());
  if (drag_) drag_->setConfig(dragSessionConfig(config_, scale_));
}

void LayoutSession::reset(const LayoutTree& tree) {
  drag_.reset();
  commit(tree);
}

void LayoutSession::commit(LayoutTree next) {
  tree_ = std::move(next);
  ids_.observeTab(tree_.maxTabId());
  ids_.observePanel(tree_.maxPanelId());
}

PanelBounds LayoutSession::bounds() const {
  return computeBounds(tree_, containerRect());
}

Id LayoutSession::openTab(const std::string& title, std::uint64_t content, Id panelId) {
  if (tree_.isEmpty()) {
    if (panelId != kInvalidId) return kInvalidId;
    Panel p;
    p.id = ids_.nextPanel();
    Tab t{ids_.nextTab(), title, content};
    p = p.addingTab(t);
    commit(LayoutTree::leaf(std::move(p)));
    return t.id;
  }

  Id target = panelId;
  if (target == kInvalidId) {
    target = tree_.allPanels().front().id;
  } else if (!tree_.findPanel(target)) {
    return kInvalidId;
  }

  Tab t{ids_.nextTab(), title, content};
  commit(tree_.updatingPanel(target, [&](const Panel& p) { return p.addingTab(t); }));
  return t.id;
}

bool LayoutSession::closeTab(Id tabId) {
  if (!tree_.containsTab(tabId)) return false;
  if (drag_ && drag_->isDragging() && drag_->draggedTab().id == tabId) {
    drag_->cancelDrag();
    drag_.reset();
  }
  commit(tree_.removingTab(tabId));
  return true;
}

bool LayoutSession::activateTab(Id tabId) {
  const Panel* p = tree_.findPanelContainingTab(tabId);
  if (!p) return false;
  commit(tree_.updatingPanel(p->id, [&](const Panel& q) { return q.activatingTab(tabId); }));
  return true;
}

Id LayoutSession::splitPanel(Id targetPanelId, DropZoneKind edge,
                             const std::string& title, std::uint64_t content) {
  if (!isEdgeZone(edge) || !tree_.findPanel(targetPanelId)) return kInvalidId;

  // Ids are only peeked here; commit() observes them once the split lands,
  // so a rejected split leaves no gap.
  Panel fresh;
  fresh.id = ids_.peekPanel();
  fresh = fresh.addingTab(Tab{ids_.peekTab(), title, content});

  float share = config_.splitRatio;
  float firstShare = edgeInsertsBefore(edge) ? share : 1.0f - share;
  LayoutTree next = tree_.splittingPanel(targetPanelId, fresh, edge, firstShare);
  if (next == tree_) {
    std::fprintf(stderr, "LayoutSession: split of panel %llu rejected\n",
                 static_cast<unsigned long long>(targetPanelId));
    return kInvalidId;
  }
  commit(std::move(next));
  return fresh.id;
}

bool LayoutSession::moveTab(Id tabId, const DropTarget& target) {
  LayoutTree next = restructure(tree_, tabId, target, restructureConfig(config_));
  if (next == tree_) return false;
  commit(std::move(next));
  return true;
}

bool LayoutSession::resizeDivider(const LayoutPath& path, std::size_t dividerIndex, float delta) {
  LayoutTree next = tree_.resizingDivider(path, dividerIndex, delta, config_.minRatio);
  if (next == tree_) return false;
  commit(std::move(next));
  return true;
}

Id LayoutSession::navigate(Id fromPanelId, NavDirection direction) const {
  return findNearestPanel(tree_, containerRect(), fromPanelId, direction);
}

bool LayoutSession::beginDrag(Id tabId) {
  if (drag_ && drag_->isDragging()) {
    std::fprintf(stderr, "LayoutSession: beginDrag while a drag is in flight\n");
    return false;
  }
  const Panel* source = tree_.findPanelContainingTab(tabId);
  if (!source) return false;

  const Tab& tab = source->tabs[source->indexOf(tabId)];
  drag_ = std::make_unique<DragSession>(dragSessionConfig(config_, scale_));
  if (!drag_->startDrag(tab, source->id)) {
    drag_.reset();
    return false;
  }
  return true;
}

bool LayoutSession::dragMove(const Point& pointer) {
  if (!drag_ || !drag_->isDragging()) return false;
  return drag_->updatePosition(pointer, tree_, container_);
}

bool LayoutSession::endDrag() {
  if (!drag_) return false;
  DropDecision decision;
  bool dropped = drag_->endDrag(decision);
  drag_.reset();
  if (!dropped) return false;

  LayoutTree next = applyDrop(tree_, decision, restructureConfig(config_));
  if (next == tree_) return false;
  commit(std::move(next));
  return true;
}

void LayoutSession::cancelDrag() {
  if (!drag_) return;
  drag_->cancelDrag();
  drag_.reset();
}

bool LayoutSession::processDividerInput(const PointerInputState& input) {
  LayoutTree next;
  if (!dividers_.processInput(input, tree_, next)) return false;
  commit(std::move(next));
  return true;
}

std::string LayoutSession::saveJSON() const {
  return serializeLayout(tree_);
}

bool LayoutSession::loadJSON(const std::string& json) {
  LayoutTree parsed;
  if (!deserializeLayout(json, parsed)) {
    std::fprintf(stderr, "LayoutSession: loadJSON failed\n");
    return false;
  }
  reset(parsed);
  return true;
}

} // namespace dl
