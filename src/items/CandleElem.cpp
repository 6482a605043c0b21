#include "sp/items/CandleElem.hpp"

#include <algorithm>
#include <cstdio>

namespace sp {

CandleElem CandleElem::withX(double v) const {
  CandleElem e = *this;
  e.x = v;
  return e;
}

CandleElem CandleElem::withStroke(const Stroke& s) const {
  CandleElem e = *this;
  e.stroke = s;
  return e;
}

CandleElem CandleElem::withFill(const Color& c) const {
  CandleElem e = *this;
  e.fill = c;
  return e;
}

CandleElem CandleElem::withCandleWidth(double width) const {
  CandleElem e = *this;
  e.candleWidth = width;
  return e;
}

CandleElem CandleElem::withWhiskerWidth(double width) const {
  CandleElem e = *this;
  e.whiskerWidth = width;
  return e;
}

void CandleElem::addShapes(const ScreenTransform& transform, bool highlighted,
                           std::vector<Shape>& shapes) const {
  Stroke s = stroke;
  Color f = fill;
  if (highlighted) {
    auto hc = highlightedColor(stroke, fill);
    s = hc.first;
    f = hc.second;
  }

  // Body: open and close are the two y corners, so a bearish candle arrives
  // with reversed corners. rectFromValues normalizes them.
  ScreenRect body = transform.rectFromValues(
      pointAt(x - candleWidth / 2.0, candle.open),
      pointAt(x + candleWidth / 2.0, candle.close));
  shapes.push_back(makeRect(body, 0.0f, f, s));

  // Whisker
  Pos2 lo = transform.positionFromPoint(pointAt(x, candle.low));
  Pos2 hi = transform.positionFromPoint(pointAt(x, candle.high));
  shapes.push_back(makeLineSegment(lo, hi, s));
}

void CandleElem::addRulersAndText(const CandleChart& parent,
                                  const CandleElementFormatter& formatter,
                                  const PlotConfig& plot,
                                  std::vector<Shape>& shapes) const {
  if (formatter) {
    std::string text = formatter(*this, parent);
    sp::addRulersAndText(*this, plot, &text, shapes);
  } else {
    sp::addRulersAndText(*this, plot, nullptr, shapes);
  }
}

PlotPoint CandleElem::boundsMin() const {
  double px = x - std::max(candleWidth, whiskerWidth) / 2.0;
  return pointAt(px, candle.low);
}

PlotPoint CandleElem::boundsMax() const {
  double px = x + std::max(candleWidth, whiskerWidth) / 2.0;
  return pointAt(px, candle.high);
}

std::vector<PlotPoint> CandleElem::valuesWithRuler() const {
  return {
    pointAt(x, candle.open),
    pointAt(x, candle.high),
    pointAt(x, candle.low),
    pointAt(x, candle.close),
    pointAt(x, candle.volume)
  };
}

PlotPoint CandleElem::cornerValue() const {
  return pointAt(x, candle.high);
}

std::string CandleElem::defaultValuesFormat(const ScreenTransform& transform) const {
  int decimals = decimalsForScale(transform.dvalueDpos().dy);

  const char* fmt = "Open = %.*f\nHigh = %.*f\nLow = %.*f\nClose = %.*f\nVolume = %.*f";
  int len = std::snprintf(nullptr, 0, fmt,
    decimals, candle.open, decimals, candle.high, decimals, candle.low,
    decimals, candle.close, decimals, candle.volume);
  if (len <= 0) return {};

  std::string out(static_cast<std::size_t>(len) + 1, '\0');
  std::snprintf(&out[0], out.size(), fmt,
    decimals, candle.open, decimals, candle.high, decimals, candle.low,
    decimals, candle.close, decimals, candle.volume);
  out.resize(static_cast<std::size_t>(len));
  return out;
}

} // namespace sp
