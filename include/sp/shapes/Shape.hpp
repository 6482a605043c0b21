#pragma once
#include "sp/math/Geometry.hpp"
#include "sp/style/Color.hpp"

#include <cstdint>
#include <string>

namespace sp {

enum class ShapeKind : std::uint8_t {
  Rect = 1,        // filled + stroked rectangle with corner rounding
  LineSegment = 2, // two points + stroke
  Text = 3         // anchored single- or multi-line label
};

inline const char* toString(ShapeKind k) {
  switch (k) {
    case ShapeKind::Rect: return "rect";
    case ShapeKind::LineSegment: return "lineSegment";
    case ShapeKind::Text: return "text";
    default: return "unknown";
  }
}

// Which corner of the text block sits on the anchor position.
enum class TextAnchor : std::uint8_t {
  LeftTop = 1,
  LeftBottom = 2
};

// A drawable screen-space primitive. Only the fields of `kind` are meaningful.
struct Shape {
  ShapeKind kind{ShapeKind::Rect};

  // Rect
  ScreenRect rect;
  float rounding{0.0f};
  Color fill{kTransparent};

  // Rect outline / LineSegment
  Stroke stroke;

  // LineSegment
  Pos2 points[2];

  // Text
  Pos2 pos;
  TextAnchor anchor{TextAnchor::LeftBottom};
  std::string text;
  Color textColor{kTransparent};
};

inline Shape makeRect(const ScreenRect& rect, float rounding,
                      const Color& fill, const Stroke& stroke) {
  Shape s;
  s.kind = ShapeKind::Rect;
  s.rect = rect;
  s.rounding = rounding;
  s.fill = fill;
  s.stroke = stroke;
  return s;
}

inline Shape makeLineSegment(const Pos2& a, const Pos2& b, const Stroke& stroke) {
  Shape s;
  s.kind = ShapeKind::LineSegment;
  s.points[0] = a;
  s.points[1] = b;
  s.stroke = stroke;
  return s;
}

inline Shape makeText(const Pos2& pos, TextAnchor anchor,
                      const std::string& text, const Color& color) {
  Shape s;
  s.kind = ShapeKind::Text;
  s.pos = pos;
  s.anchor = anchor;
  s.text = text;
  s.textColor = color;
  return s;
}

} // namespace sp
