#include "sp/items/RectElement.hpp"

#include <cmath>

namespace sp {

std::vector<PlotPoint> RectElement::argumentsWithRuler() const {
  PlotPoint lo = boundsMin();
  PlotPoint hi = boundsMax();
  PlotPoint center{(lo.x + hi.x) * 0.5, (lo.y + hi.y) * 0.5};
  return {center};
}

int decimalsForScale(double scale) {
  double d = std::ceil(-std::log10(std::fabs(scale)));
  if (std::isnan(d)) return 0;
  if (d < 0.0) return 0;
  if (d > 6.0) return 6;
  return static_cast<int>(d);
}

// Full-width (horizontal) or full-height (vertical) guide through a data point.
static Shape rulerAt(const PlotPoint& value, bool vertical, const PlotConfig& plot) {
  const ScreenTransform& t = plot.transform;
  const ScreenRect& frame = t.frame();
  Pos2 p = t.positionFromPoint(value);

  Stroke stroke{1.0f, plot.rulerColor};
  if (vertical) {
    return makeLineSegment({p.x, frame.top()}, {p.x, frame.bottom()}, stroke);
  }
  return makeLineSegment({frame.left(), p.y}, {frame.right(), p.y}, stroke);
}

void addRulersAndText(const RectElement& elem, const PlotConfig& plot,
                      const std::string* text, std::vector<Shape>& shapes) {
  Orientation orientation = elem.orientation();
  bool vertical = orientation == Orientation::Vertical;

  bool showArgument = (plot.showX && vertical) || (plot.showY && !vertical);
  bool showValues = (plot.showY && vertical) || (plot.showX && !vertical);

  // Argument rulers run along the value axis
  if (showArgument) {
    for (const auto& pos : elem.argumentsWithRuler()) {
      shapes.push_back(rulerAt(pos, vertical, plot));
    }
  }

  // Value rulers run along the argument axis
  if (showValues) {
    for (const auto& pos : elem.valuesWithRuler()) {
      shapes.push_back(rulerAt(pos, !vertical, plot));
    }
  }

  std::string label;
  if (text) {
    label = *text;
  } else {
    label = elem.name();
    if (showValues) {
      if (!label.empty()) label += "\n";
      label += elem.defaultValuesFormat(plot.transform);
    }
  }
  if (label.empty()) return;

  Pos2 anchor = plot.transform.positionFromPoint(elem.cornerValue()) + Pos2{3.0f, -2.0f};
  shapes.push_back(makeText(anchor, TextAnchor::LeftBottom, label, plot.textColor));
}

} // namespace sp
