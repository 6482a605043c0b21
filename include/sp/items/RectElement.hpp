#pragma once
#include "sp/math/Geometry.hpp"
#include "sp/shapes/Shape.hpp"
#include "sp/style/Color.hpp"
#include "sp/viewport/ScreenTransform.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sp {

// Vertical: argument on x, values on y (candles, vertical bars).
enum class Orientation : std::uint8_t {
  Horizontal = 1,
  Vertical = 2
};

// What the hover overlay needs from the current frame.
struct PlotConfig {
  const ScreenTransform& transform;
  bool showX{true};
  bool showY{true};
  Color rulerColor{0.39f, 0.39f, 0.39f, 1.0f};
  Color textColor{0.8f, 0.8f, 0.85f, 1.0f};
};

// Capability set shared by chart item types that occupy a rectangle
// (candles, bars, boxes). Lets the hover/auto-fit code treat them uniformly.
class RectElement {
public:
  virtual ~RectElement() = default;

  virtual std::string name() const = 0;

  // Data-space bounding box.
  virtual PlotPoint boundsMin() const = 0;
  virtual PlotPoint boundsMax() const = 0;

  // Points that get a value ruler (horizontal line for vertical elements).
  virtual std::vector<PlotPoint> valuesWithRuler() const = 0;

  // Points that get an argument ruler. Defaults to the bounds center.
  virtual std::vector<PlotPoint> argumentsWithRuler() const;

  virtual Orientation orientation() const = 0;

  // Anchor for the hover label.
  virtual PlotPoint cornerValue() const = 0;

  virtual std::string defaultValuesFormat(const ScreenTransform& transform) const = 0;
};

// Decimal places for a value axis at the given data-units-per-pixel scale.
// clamp(ceil(-log10(|scale|)), 0, 6).
int decimalsForScale(double scale);

// Draws the ruler lines for elem and its label. text == nullptr means no
// custom text: the label falls back to name + default values format.
void addRulersAndText(const RectElement& elem, const PlotConfig& plot,
                      const std::string* text, std::vector<Shape>& shapes);

} // namespace sp
