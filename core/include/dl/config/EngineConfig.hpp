#pragma once
#include "dl/layout/DividerInteraction.hpp"
#include "dl/layout/DragSession.hpp"
#include "dl/layout/DropZoneCalculator.hpp"
#include "dl/layout/LayoutRestructurer.hpp"
#include "dl/layout/TabStrip.hpp"

#include <string>

namespace dl {

// Every tunable of the engine for one window.
struct EngineConfig {
  float headerHeight{30.0f};      // logical units, scaled by the session's scale factor
  float dividerThickness{3.0f};
  float hitTolerancePx{4.0f};
  float splitRatio{0.5f};         // new panel's share on an edge drop / split
  float minRatio{0.1f};           // divider drag floor
  DropZoneConfig dropZone;
  TabStripConfig tabStrip;
};

// Derived component configs.
DragSessionConfig dragSessionConfig(const EngineConfig& cfg, float scale);
DividerInteractionConfig dividerConfig(const EngineConfig& cfg);
RestructureConfig restructureConfig(const EngineConfig& cfg);

std::string serializeEngineConfig(const EngineConfig& cfg);

// Missing keys keep the values already in `out`. Returns false on parse
// errors or out-of-range values, leaving `out` untouched.
bool deserializeEngineConfig(const std::string& json, EngineConfig& out);

} // namespace dl
