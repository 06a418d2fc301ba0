#include "dl/layout/TabStrip.hpp"

#include <algorithm>

namespace dl {

std::size_t codePointCount(const std::string& s) {
  std::size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) n++;
  }
  return n;
}

float idealTabWidth(const Tab& tab, const TabStripConfig& cfg) {
  float text = static_cast<float>(codePointCount(tab.title)) * cfg.glyphAdvance;
  float ideal = text + cfg.horizontalPadding + cfg.closeButtonWidth;
  return std::min(std::max(ideal, cfg.minTabWidth), cfg.maxTabWidth);
}

std::vector<Rect> computeTabSlots(const Panel& panel, const Rect& header,
                                  const TabStripConfig& cfg) {
  std::vector<Rect> slots;
  if (panel.tabs.empty()) return slots;

  std::vector<float> widths;
  widths.reserve(panel.tabs.size());
  float totalWidth = 0.0f;
  for (const auto& t : panel.tabs) {
    widths.push_back(idealTabWidth(t, cfg));
    totalWidth += widths.back();
  }

  float totalSpacing = cfg.spacing * static_cast<float>(panel.tabs.size() - 1);
  if (totalWidth + totalSpacing > header.width && totalWidth > 0.0f) {
    float scale = std::max(0.0f, header.width - totalSpacing) / totalWidth;
    for (float& w : widths) w = std::max(w * scale, cfg.minTabWidth);
  }

  slots.reserve(widths.size());
  float x = header.x;
  for (float w : widths) {
    slots.push_back(Rect{x, header.y, w, header.height});
    x += w + cfg.spacing;
  }
  return slots;
}

std::size_t insertionIndexAt(const std::vector<Rect>& slots, float x) {
  for (std::size_t i = 0; i < slots.size(); i++) {
    if (x < slots[i].midX()) return i;
  }
  return slots.size();
}

} // namespace dl
