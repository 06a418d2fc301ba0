#include "dl/layout/Panel.hpp"

#include <algorithm>

namespace dl {

bool operator==(const Tab& a, const Tab& b) {
  return a.id == b.id && a.title == b.title && a.content == b.content;
}

bool operator==(const Panel& a, const Panel& b) {
  return a.id == b.id && a.activeTabIndex == b.activeTabIndex && a.tabs == b.tabs;
}

const Tab* Panel::activeTab() const {
  if (tabs.empty()) return nullptr;
  return &tabs[std::min(activeTabIndex, tabs.size() - 1)];
}

std::size_t Panel::indexOf(Id tabId) const {
  for (std::size_t i = 0; i < tabs.size(); i++) {
    if (tabs[i].id == tabId) return i;
  }
  return tabs.size();
}

Panel Panel::addingTab(const Tab& tab, std::size_t index) const {
  Panel p = *this;
  std::size_t at = std::min(index, p.tabs.size());
  p.tabs.insert(p.tabs.begin() + static_cast<std::ptrdiff_t>(at), tab);
  p.activeTabIndex = at;
  return p;
}

Panel Panel::removingTab(Id tabId) const {
  std::size_t idx = indexOf(tabId);
  if (idx >= tabs.size()) return *this;

  Panel p = *this;
  p.tabs.erase(p.tabs.begin() + static_cast<std::ptrdiff_t>(idx));
  if (p.tabs.empty()) {
    p.activeTabIndex = 0;
  } else if (idx < activeTabIndex) {
    p.activeTabIndex = activeTabIndex - 1;
  } else {
    p.activeTabIndex = std::min(activeTabIndex, p.tabs.size() - 1);
  }
  return p;
}

Panel Panel::activatingTab(Id tabId) const {
  std::size_t idx = indexOf(tabId);
  if (idx >= tabs.size()) return *this;
  Panel p = *this;
  p.activeTabIndex = idx;
  return p;
}

Panel Panel::reorderingTabs(const std::vector<Id>& order) const {
  if (order.size() != tabs.size()) return *this;

  std::vector<Tab> reordered;
  reordered.reserve(tabs.size());
  for (Id id : order) {
    std::size_t idx = indexOf(id);
    if (idx >= tabs.size()) return *this;
    // Duplicate ids in `order` would pick the same tab twice.
    for (const auto& t : reordered) {
      if (t.id == id) return *this;
    }
    reordered.push_back(tabs[idx]);
  }

  Panel p = *this;
  const Tab* active = activeTab();
  p.tabs = std::move(reordered);
  if (active) p.activeTabIndex = p.indexOf(active->id);
  return p;
}

} // namespace dl
