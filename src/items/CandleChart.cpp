#include "sp/items/CandleChart.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace sp {

CandleChart::CandleChart(std::string name, std::vector<CandleElem> elems)
  : name_(std::move(name)), elems_(std::move(elems)) {}

CandleChart CandleChart::fromCandles(const std::string& name,
                                     const std::vector<Candle>& candles,
                                     const CandleChartConfig& config,
                                     const Theme& theme) {
  std::vector<CandleElem> elems;
  elems.reserve(candles.size());

  for (std::size_t i = 0; i < candles.size(); i++) {
    const Candle& c = candles[i];
    const Color& color = c.close >= c.open ? theme.candleUp : theme.candleDown;

    elems.push_back(CandleElem(c)
        .withX(config.origin + static_cast<double>(i) * config.spacing)
        .withCandleWidth(config.candleWidth)
        .withWhiskerWidth(config.whiskerWidth)
        .withStroke(Stroke{config.strokeWidth, color})
        .withFill(color));
  }

  return CandleChart(name, std::move(elems));
}

PlotBounds CandleChart::bounds() const {
  PlotBounds b;
  for (const auto& e : elems_) {
    b.extendWith(e.boundsMin());
    b.extendWith(e.boundsMax());
  }
  return b;
}

void CandleChart::addShapes(const ScreenTransform& transform,
                            std::vector<Shape>& shapes) const {
  for (const auto& e : elems_) {
    e.addShapes(transform, highlight_, shapes);
  }
}

ClosestElem CandleChart::findClosest(const Pos2& pointer,
                                     const ScreenTransform& transform) const {
  ClosestElem best;
  best.distSq = std::numeric_limits<float>::max();

  for (std::size_t i = 0; i < elems_.size(); i++) {
    ScreenRect r = transform.rectFromValues(elems_[i].boundsMin(), elems_[i].boundsMax());
    float d = r.distanceSqToPos(pointer);
    if (d < best.distSq) {
      best.found = true;
      best.index = i;
      best.distSq = d;
    }
  }

  if (!best.found) best.distSq = 0;
  return best;
}

void CandleChart::onHover(std::size_t index, const PlotConfig& plot,
                          std::vector<Shape>& shapes) const {
  if (index >= elems_.size()) {
    throw std::out_of_range("CandleChart::onHover: index out of range");
  }

  const CandleElem& e = elems_[index];
  e.addShapes(plot.transform, true, shapes);
  e.addRulersAndText(*this, formatter_, plot, shapes);
}

} // namespace sp
