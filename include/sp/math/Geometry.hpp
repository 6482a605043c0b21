#pragma once
#include <algorithm>
#include <cmath>
#include <limits>

namespace sp {

// A point in data space (time/category x, price/quantity y).
struct PlotPoint {
  double x{0}, y{0};
};

inline bool operator==(const PlotPoint& a, const PlotPoint& b) {
  return a.x == b.x && a.y == b.y;
}

// A point in screen space (pixels, y grows downward).
struct Pos2 {
  float x{0}, y{0};
};

inline Pos2 operator+(const Pos2& a, const Pos2& b) { return {a.x + b.x, a.y + b.y}; }

// Screen-space rectangle. fromTwoPos() normalizes so min <= max.
struct ScreenRect {
  Pos2 min, max;

  static ScreenRect fromTwoPos(const Pos2& a, const Pos2& b) {
    ScreenRect r;
    r.min = {std::min(a.x, b.x), std::min(a.y, b.y)};
    r.max = {std::max(a.x, b.x), std::max(a.y, b.y)};
    return r;
  }

  float left() const   { return min.x; }
  float right() const  { return max.x; }
  float top() const    { return min.y; }
  float bottom() const { return max.y; }
  float width() const  { return max.x - min.x; }
  float height() const { return max.y - min.y; }

  bool contains(const Pos2& p) const {
    return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
  }

  // Squared distance from p to the rectangle, 0 when inside.
  float distanceSqToPos(const Pos2& p) const {
    float dx = 0.0f;
    if (p.x < min.x) dx = min.x - p.x;
    else if (p.x > max.x) dx = p.x - max.x;
    float dy = 0.0f;
    if (p.y < min.y) dy = min.y - p.y;
    else if (p.y > max.y) dy = p.y - max.y;
    return dx * dx + dy * dy;
  }
};

// Axis-aligned data-space bounds. Starts out inverted (invalid) so the first
// extend() defines it.
struct PlotBounds {
  double minX{std::numeric_limits<double>::infinity()};
  double minY{std::numeric_limits<double>::infinity()};
  double maxX{-std::numeric_limits<double>::infinity()};
  double maxY{-std::numeric_limits<double>::infinity()};

  static PlotBounds fromMinMax(const PlotPoint& lo, const PlotPoint& hi) {
    PlotBounds b;
    b.minX = lo.x; b.minY = lo.y;
    b.maxX = hi.x; b.maxY = hi.y;
    return b;
  }

  bool isValid() const {
    return std::isfinite(minX) && std::isfinite(minY) &&
           std::isfinite(maxX) && std::isfinite(maxY) &&
           minX <= maxX && minY <= maxY;
  }

  double width() const  { return maxX - minX; }
  double height() const { return maxY - minY; }

  void extendWith(const PlotPoint& p) {
    minX = std::min(minX, p.x);
    minY = std::min(minY, p.y);
    maxX = std::max(maxX, p.x);
    maxY = std::max(maxY, p.y);
  }

  void merge(const PlotBounds& other) {
    minX = std::min(minX, other.minX);
    minY = std::min(minY, other.minY);
    maxX = std::max(maxX, other.maxX);
    maxY = std::max(maxY, other.maxY);
  }

  // Grow each side by a fraction of the span.
  void addRelativeMargin(double fraction) {
    double mx = width() * fraction;
    double my = height() * fraction;
    minX -= mx; maxX += mx;
    minY -= my; maxY += my;
  }
};

} // namespace sp
