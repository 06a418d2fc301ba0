#pragma once

namespace dl {

// Generic pointer snapshot, NOT tied to any windowing toolkit.
struct PointerInputState {
  double cursorX{0}, cursorY{0};  // pixels, 0=left/top
  double dragDx{0}, dragDy{0};    // pixel deltas this frame
  bool dragging{false};           // primary button held
};

} // namespace dl
