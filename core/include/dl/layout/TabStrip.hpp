#pragma once
#include "dl/geometry/Rect.hpp"
#include "dl/layout/Panel.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace dl {

// Tab header sizing. There is no font here, so titles are measured as
// code points times a fixed glyph advance.
struct TabStripConfig {
  float minTabWidth{100.0f};
  float maxTabWidth{200.0f};
  float horizontalPadding{34.0f};  // padding plus content spacing
  float closeButtonWidth{20.0f};
  float glyphAdvance{6.5f};
  float spacing{4.0f};
};

// Number of UTF-8 code points in `s` (continuation bytes are skipped).
std::size_t codePointCount(const std::string& s);

// Ideal width of one tab, clamped to [minTabWidth, maxTabWidth].
float idealTabWidth(const Tab& tab, const TabStripConfig& cfg);

// Slot rectangles laid out left to right from header.x. If the ideal widths
// overflow the header they are compressed proportionally, never below
// minTabWidth (so slots may still run past the header's right edge).
std::vector<Rect> computeTabSlots(const Panel& panel, const Rect& header,
                                  const TabStripConfig& cfg);

// Index of the first slot whose centre lies right of x, else slots.size().
std::size_t insertionIndexAt(const std::vector<Rect>& slots, float x);

} // namespace dl
