#pragma once
#include "sp/config/CandleChartConfig.hpp"
#include "sp/items/CandleElem.hpp"
#include "sp/math/Geometry.hpp"
#include "sp/style/Theme.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace sp {

// Result of a pointer proximity query, distance in squared screen pixels.
struct ClosestElem {
  bool found{false};
  std::size_t index{0};
  float distSq{0};
};

// A named series of candles, one per time bucket. Owns element positioning;
// the elements themselves stay plain values.
class CandleChart {
public:
  CandleChart() = default;
  CandleChart(std::string name, std::vector<CandleElem> elems);

  // Element i goes to x = origin + i * spacing, colored up when close >= open.
  static CandleChart fromCandles(const std::string& name,
                                 const std::vector<Candle>& candles,
                                 const CandleChartConfig& config,
                                 const Theme& theme);

  const std::string& name() const { return name_; }
  const std::vector<CandleElem>& elements() const { return elems_; }
  std::size_t size() const { return elems_.size(); }

  // Hover label; stored here for convenience, forwarded explicitly on hover.
  void setElementFormatter(CandleElementFormatter fmt) { formatter_ = std::move(fmt); }
  const CandleElementFormatter& elementFormatter() const { return formatter_; }

  // Draw every element emphasized.
  void setHighlight(bool on) { highlight_ = on; }
  bool highlight() const { return highlight_; }

  // Union of element bounds. Invalid when the chart is empty.
  PlotBounds bounds() const;

  void addShapes(const ScreenTransform& transform, std::vector<Shape>& shapes) const;

  ClosestElem findClosest(const Pos2& pointer, const ScreenTransform& transform) const;

  // Highlighted shapes plus rulers and label for element `index`.
  // Throws std::out_of_range for a bad index.
  void onHover(std::size_t index, const PlotConfig& plot, std::vector<Shape>& shapes) const;

private:
  std::string name_;
  std::vector<CandleElem> elems_;
  CandleElementFormatter formatter_;
  bool highlight_{false};
};

} // namespace sp
