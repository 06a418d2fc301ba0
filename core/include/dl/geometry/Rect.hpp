#pragma once

namespace dl {

// Container coordinates: origin top-left, x right, y down.
struct Point {
  float x{0}, y{0};
};

struct Size {
  float width{0}, height{0};
};

struct Rect {
  float x{0}, y{0};
  float width{0}, height{0};

  float left() const { return x; }
  float top() const { return y; }
  float right() const { return x + width; }
  float bottom() const { return y + height; }
  float midX() const { return x + width * 0.5f; }
  float midY() const { return y + height * 0.5f; }
  float area() const { return width * height; }

  // Closed on all edges: a point on a shared edge belongs to both rects and
  // callers break the tie by visiting order.
  bool contains(const Point& p) const {
    return p.x >= x && p.x <= x + width && p.y >= y && p.y <= y + height;
  }
};

inline bool operator==(const Rect& a, const Rect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

} // namespace dl
