#pragma once
#include "dl/ids/Id.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dl {

// A tab is an immutable value; identity is the id.
struct Tab {
  Id id{kInvalidId};
  std::string title;
  std::uint64_t content{0};  // opaque handle owned by the host (e.g. terminal number)
};

bool operator==(const Tab& a, const Tab& b);
inline bool operator!=(const Tab& a, const Tab& b) { return !(a == b); }

// Ordered tab list plus the active index. All mutators return a new Panel.
// A panel with zero tabs only exists transiently; LayoutTree prunes it.
struct Panel {
  Id id{kInvalidId};
  std::vector<Tab> tabs;
  std::size_t activeTabIndex{0};

  bool isEmpty() const { return tabs.empty(); }
  std::size_t tabCount() const { return tabs.size(); }

  // Returns nullptr when the panel is empty.
  const Tab* activeTab() const;

  // Index of the tab, or tabCount() if absent.
  std::size_t indexOf(Id tabId) const;
  bool containsTab(Id tabId) const { return indexOf(tabId) < tabs.size(); }

  // Inserts at index (clamped to [0, tabCount]) and activates the new tab.
  Panel addingTab(const Tab& tab, std::size_t index) const;
  Panel addingTab(const Tab& tab) const { return addingTab(tab, tabs.size()); }

  // The active index follows the previously active tab. If the active tab is
  // the one removed, the tab sliding into its slot becomes active.
  Panel removingTab(Id tabId) const;

  Panel activatingTab(Id tabId) const;

  // Accepts only a permutation of the current ids; otherwise returns *this.
  Panel reorderingTabs(const std::vector<Id>& order) const;
};

bool operator==(const Panel& a, const Panel& b);
inline bool operator!=(const Panel& a, const Panel& b) { return !(a == b); }

} // namespace dl
