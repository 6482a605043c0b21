#pragma once
#include <utility>

namespace sp {

// Straight (non-premultiplied) RGBA, each channel in [0, 1].
struct Color {
  float r{0}, g{0}, b{0}, a{0};
};

inline bool operator==(const Color& x, const Color& y) {
  return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}
inline bool operator!=(const Color& x, const Color& y) { return !(x == y); }

inline constexpr Color kTransparent{0.0f, 0.0f, 0.0f, 0.0f};

struct Stroke {
  float width{1.0f};
  Color color{kTransparent};
};

inline bool operator==(const Stroke& x, const Stroke& y) {
  return x.width == y.width && x.color == y.color;
}
inline bool operator!=(const Stroke& x, const Stroke& y) { return !(x == y); }

// Emphasized variant used for hovered/highlighted items:
// doubled stroke width, fill alpha doubled (capped at 1).
std::pair<Stroke, Color> highlightedColor(const Stroke& stroke, const Color& fill);

} // namespace sp
