#pragma once
#include "sp/items/RectElement.hpp"
#include "sp/shapes/Shape.hpp"
#include "sp/style/Color.hpp"
#include "sp/viewport/ScreenTransform.hpp"

#include <functional>
#include <string>
#include <vector>

namespace sp {

// One OHLCV record for a time bucket. Values are stored as given; ordering
// (low <= open, close <= high) is not checked.
struct Candle {
  double open{0}, high{0}, low{0}, close{0}, volume{0};

  Candle() = default;
  Candle(double open, double high, double low, double close, double volume)
    : open(open), high(high), low(low), close(close), volume(volume) {}
};

inline bool operator==(const Candle& a, const Candle& b) {
  return a.open == b.open && a.high == b.high && a.low == b.low &&
         a.close == b.close && a.volume == b.volume;
}

class CandleChart;
struct CandleElem;

// Caller-supplied hover label: (element, owning chart) -> text.
using CandleElementFormatter =
    std::function<std::string(const CandleElem&, const CandleChart&)>;

// A positioned candle plus its visual style. Setters return modified copies:
//
//   auto e = CandleElem(c).withCandleWidth(0.4).withFill(up);
//
// Widths are taken as-is; zero or negative values degenerate or invert the body.
struct CandleElem : public RectElement {
  double x{0};
  Candle candle;
  double candleWidth{0.25};   // full width of the body
  double whiskerWidth{0.15};  // full width reserved around the whisker in bounds
  Stroke stroke{1.0f, kTransparent};
  Color fill{kTransparent};

  explicit CandleElem(const Candle& c) : candle(c) {}

  CandleElem withX(double v) const;
  CandleElem withStroke(const Stroke& s) const;
  CandleElem withFill(const Color& c) const;
  CandleElem withCandleWidth(double width) const;
  CandleElem withWhiskerWidth(double width) const;

  // Appends the body rectangle and the whisker line (always two shapes).
  void addShapes(const ScreenTransform& transform, bool highlighted,
                 std::vector<Shape>& shapes) const;

  // Hover overlay. An empty formatter means no custom text.
  void addRulersAndText(const CandleChart& parent,
                        const CandleElementFormatter& formatter,
                        const PlotConfig& plot,
                        std::vector<Shape>& shapes) const;

  // RectElement
  std::string name() const override { return {}; }
  PlotPoint boundsMin() const override;
  PlotPoint boundsMax() const override;
  std::vector<PlotPoint> valuesWithRuler() const override;
  Orientation orientation() const override { return Orientation::Vertical; }
  PlotPoint cornerValue() const override;
  std::string defaultValuesFormat(const ScreenTransform& transform) const override;

private:
  PlotPoint pointAt(double px, double value) const { return {px, value}; }
};

} // namespace sp
