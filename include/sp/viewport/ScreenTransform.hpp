#pragma once
#include "sp/math/Geometry.hpp"

namespace sp {

// Per-axis data units per screen pixel.
struct DValueDPos {
  double dx{0}, dy{0};
};

// Maps data space to screen space for one plot frame.
// Screen y grows downward, data y grows upward.
class ScreenTransform {
public:
  ScreenTransform() = default;
  ScreenTransform(const ScreenRect& frame, const PlotBounds& bounds);

  void setFrame(const ScreenRect& frame);
  void setBounds(const PlotBounds& bounds);

  // Coordinate mapping
  Pos2 positionFromPoint(const PlotPoint& value) const;
  PlotPoint valueFromPosition(const Pos2& pos) const;
  ScreenRect rectFromValues(const PlotPoint& a, const PlotPoint& b) const;

  // Zoom metric: dy is negative because the axes point in opposite directions.
  DValueDPos dvalueDpos() const;

  // Pan/zoom
  void translateBounds(float dxPixels, float dyPixels);
  // factor > 0 zooms in around center; factor <= -1 leaves the bounds as they are.
  void zoom(double factor, const Pos2& center);

  const ScreenRect& frame() const { return frame_; }
  const PlotBounds& bounds() const { return bounds_; }

private:
  ScreenRect frame_{{0.0f, 0.0f}, {800.0f, 600.0f}};
  PlotBounds bounds_{PlotBounds::fromMinMax({0, 0}, {1, 1})};
};

} // namespace sp
