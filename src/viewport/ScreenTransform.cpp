#include "sp/viewport/ScreenTransform.hpp"

#include <cmath>

namespace sp {

// Widen a zero-size axis so remapping never divides by zero.
static void widenDegenerate(double& lo, double& hi) {
  if (hi - lo == 0.0) {
    double center = lo;
    lo = center - 0.5;
    hi = center + 0.5;
  }
}

ScreenTransform::ScreenTransform(const ScreenRect& frame, const PlotBounds& bounds) {
  setFrame(frame);
  setBounds(bounds);
}

void ScreenTransform::setFrame(const ScreenRect& frame) {
  frame_ = frame;
}

void ScreenTransform::setBounds(const PlotBounds& bounds) {
  bounds_ = bounds;
  widenDegenerate(bounds_.minX, bounds_.maxX);
  widenDegenerate(bounds_.minY, bounds_.maxY);
}

Pos2 ScreenTransform::positionFromPoint(const PlotPoint& value) const {
  double tx = (value.x - bounds_.minX) / bounds_.width();
  double ty = (value.y - bounds_.minY) / bounds_.height();

  double px = static_cast<double>(frame_.left()) + tx * static_cast<double>(frame_.width());
  double py = static_cast<double>(frame_.bottom()) - ty * static_cast<double>(frame_.height()); // Y flipped

  return {static_cast<float>(px), static_cast<float>(py)};
}

PlotPoint ScreenTransform::valueFromPosition(const Pos2& pos) const {
  double tx = (static_cast<double>(pos.x) - static_cast<double>(frame_.left())) /
              static_cast<double>(frame_.width());
  double ty = (static_cast<double>(frame_.bottom()) - static_cast<double>(pos.y)) /
              static_cast<double>(frame_.height());

  return {bounds_.minX + tx * bounds_.width(),
          bounds_.minY + ty * bounds_.height()};
}

ScreenRect ScreenTransform::rectFromValues(const PlotPoint& a, const PlotPoint& b) const {
  return ScreenRect::fromTwoPos(positionFromPoint(a), positionFromPoint(b));
}

DValueDPos ScreenTransform::dvalueDpos() const {
  return {bounds_.width() / static_cast<double>(frame_.width()),
          -bounds_.height() / static_cast<double>(frame_.height())};
}

void ScreenTransform::translateBounds(float dxPixels, float dyPixels) {
  DValueDPos s = dvalueDpos();
  double dataDx = static_cast<double>(dxPixels) * s.dx;
  double dataDy = static_cast<double>(dyPixels) * s.dy;

  // Dragging right shows earlier data
  bounds_.minX -= dataDx;
  bounds_.maxX -= dataDx;
  bounds_.minY -= dataDy;
  bounds_.maxY -= dataDy;
}

void ScreenTransform::zoom(double factor, const Pos2& center) {
  // Factors at or below -1 would divide by zero or flip the bounds
  if (!(factor > -1.0)) return;

  PlotPoint pivot = valueFromPosition(center);

  double scale = 1.0 / (1.0 + factor); // factor > 0 = zoom in = smaller range

  bounds_.minX = pivot.x + (bounds_.minX - pivot.x) * scale;
  bounds_.maxX = pivot.x + (bounds_.maxX - pivot.x) * scale;
  bounds_.minY = pivot.y + (bounds_.minY - pivot.y) * scale;
  bounds_.maxY = pivot.y + (bounds_.maxY - pivot.y) * scale;
}

} // namespace sp
