#include "sp/style/Color.hpp"

#include <algorithm>

namespace sp {

std::pair<Stroke, Color> highlightedColor(const Stroke& stroke, const Color& fill) {
  Stroke s = stroke;
  s.width *= 2.0f;

  Color f = fill;
  f.a = std::min(2.0f * fill.a, 1.0f);

  return {s, f};
}

} // namespace sp
