#pragma once
#include <cstdint>
#include <string>
#include <stdexcept>

namespace dl {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Accept either JSON numeric IDs (preferred) or string decimal.
inline Id parseIdString(const std::string& s) {
  if (s.empty()) return kInvalidId;
  std::uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') throw std::runtime_error("Id must be decimal digits");
    v = v * 10 + static_cast<std::uint64_t>(c - '0');
  }
  return static_cast<Id>(v);
}

// Monotonic id source for one window. Panels and tabs draw from separate
// counters; observe() keeps the counters ahead of ids loaded from disk.
class IdAllocator {
public:
  Id nextTab() { return nextTab_++; }
  Id nextPanel() { return nextPanel_++; }
  // The id the matching next*() call would hand out, without consuming it.
  Id peekTab() const { return nextTab_; }
  Id peekPanel() const { return nextPanel_; }

  void observeTab(Id id) { if (id >= nextTab_) nextTab_ = id + 1; }
  void observePanel(Id id) { if (id >= nextPanel_) nextPanel_ = id + 1; }

private:
  Id nextTab_{1};
  Id nextPanel_{1};
};

} // namespace dl
