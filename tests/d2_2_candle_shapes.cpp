// D2.2: CandleElem::addShapes (pure C++)
// Tests: exactly 2 shapes appended (rect + whisker), screen coordinates,
// bearish candle renders the same rect as its mirrored bullish twin,
// highlight changes stroke/fill without mutating the element.

#include "sp/items/CandleElem.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL [%s]: %.8f != %.8f (eps=%.8f)\n",
                 msg, a, b, eps);
    std::exit(1);
  }
}

static bool sameRect(const sp::ScreenRect& a, const sp::ScreenRect& b) {
  return a.min.x == b.min.x && a.min.y == b.min.y &&
         a.max.x == b.max.x && a.max.y == b.max.y;
}

int main() {
  constexpr double EPS = 1e-3;

  // Frame 1000x200 over data x [0,10], y [0,20]: 100 px per x unit, 10 px per y unit
  sp::ScreenTransform t(sp::ScreenRect{{0.0f, 0.0f}, {1000.0f, 200.0f}},
                        sp::PlotBounds::fromMinMax({0.0, 0.0}, {10.0, 20.0}));

  sp::Stroke stroke{1.0f, {0.0f, 0.8f, 0.4f, 1.0f}};
  sp::Color fill{0.0f, 0.8f, 0.4f, 0.4f};

  // --- Test 1: two primitives with the expected geometry ---
  {
    auto e = sp::CandleElem(sp::Candle(10, 12, 9, 11, 500))
        .withX(3.0).withCandleWidth(0.4).withStroke(stroke).withFill(fill);

    std::vector<sp::Shape> shapes;
    e.addShapes(t, false, shapes);
    requireTrue(shapes.size() == 2, "2 shapes");

    const sp::Shape& body = shapes[0];
    requireTrue(body.kind == sp::ShapeKind::Rect, "first is rect");
    requireTrue(body.rounding == 0.0f, "no rounding");
    requireNear(body.rect.min.x, 280.0, EPS, "body left = (3-0.2)*100");
    requireNear(body.rect.max.x, 320.0, EPS, "body right = (3+0.2)*100");
    requireNear(body.rect.min.y, 90.0, EPS, "body top = close 11");
    requireNear(body.rect.max.y, 100.0, EPS, "body bottom = open 10");
    requireTrue(body.fill == fill, "own fill");
    requireTrue(body.stroke == stroke, "own stroke");

    const sp::Shape& whisker = shapes[1];
    requireTrue(whisker.kind == sp::ShapeKind::LineSegment, "second is line");
    requireNear(whisker.points[0].x, 300.0, EPS, "whisker x");
    requireNear(whisker.points[0].y, 110.0, EPS, "whisker starts at low 9");
    requireNear(whisker.points[1].x, 300.0, EPS, "whisker x end");
    requireNear(whisker.points[1].y, 80.0, EPS, "whisker ends at high 12");
    requireTrue(whisker.stroke == stroke, "whisker uses stroke");

    std::printf("  Test 1 (geometry) PASS\n");
  }

  // --- Test 2: bearish body equals bullish body with open/close swapped ---
  {
    auto bull = sp::CandleElem(sp::Candle(10, 12, 9, 11, 0)).withX(5.0);
    auto bear = sp::CandleElem(sp::Candle(11, 12, 9, 10, 0)).withX(5.0);

    std::vector<sp::Shape> a, b;
    bull.addShapes(t, false, a);
    bear.addShapes(t, false, b);
    requireTrue(a.size() == 2 && b.size() == 2, "2 shapes each");
    requireTrue(sameRect(a[0].rect, b[0].rect), "bearish rect identical");
    requireTrue(b[0].rect.min.y <= b[0].rect.max.y, "bearish rect normalized");

    std::printf("  Test 2 (bearish) PASS\n");
  }

  // --- Test 3: highlight swaps stroke/fill without mutating the element ---
  {
    auto e = sp::CandleElem(sp::Candle(10, 12, 9, 11, 0))
        .withX(3.0).withStroke(stroke).withFill(fill);

    std::vector<sp::Shape> hi, lo, hi2;
    e.addShapes(t, true, hi);
    e.addShapes(t, false, lo);
    e.addShapes(t, true, hi2);

    requireTrue(hi.size() == 2 && lo.size() == 2, "2 shapes per call");
    requireTrue(hi[0].stroke.width == 2.0f, "highlighted stroke width");
    requireNear(hi[0].fill.a, 0.8, 1e-6, "highlighted fill alpha");
    requireTrue(hi[1].stroke.width == 2.0f, "highlighted whisker stroke");

    requireTrue(lo[0].stroke == stroke, "normal call unaffected by previous highlight");
    requireTrue(lo[0].fill == fill, "normal fill unaffected");
    requireTrue(hi2[0].stroke == hi[0].stroke && hi2[0].fill == hi[0].fill,
                "repeated highlight identical");

    requireTrue(e.stroke == stroke && e.fill == fill, "element not mutated");

    std::printf("  Test 3 (highlight) PASS\n");
  }

  // --- Test 4: appends, never clears ---
  {
    std::vector<sp::Shape> shapes;
    shapes.push_back(sp::makeText({1.0f, 1.0f}, sp::TextAnchor::LeftTop, "keep", sp::kTransparent));

    sp::CandleElem e(sp::Candle(1, 2, 0, 1.5, 0));
    e.addShapes(t, false, shapes);
    e.addShapes(t, true, shapes);
    requireTrue(shapes.size() == 5, "1 + 2 + 2 shapes");
    requireTrue(shapes[0].kind == sp::ShapeKind::Text && shapes[0].text == "keep",
                "existing shape preserved");

    std::printf("  Test 4 (append-only) PASS\n");
  }

  // --- Test 5: degenerate inputs still give 2 shapes ---
  {
    auto zero = sp::CandleElem(sp::Candle(5, 5, 5, 5, 0)).withCandleWidth(0.0);
    auto neg = sp::CandleElem(sp::Candle(5, 8, 2, 6, 0)).withCandleWidth(-0.5);
    double nan = std::nan("");
    auto bad = sp::CandleElem(sp::Candle(nan, nan, nan, nan, nan));

    std::vector<sp::Shape> shapes;
    zero.addShapes(t, false, shapes);
    requireTrue(shapes.size() == 2, "zero width: 2 shapes");
    requireTrue(shapes[0].rect.width() == 0.0f, "zero-area rect");

    neg.addShapes(t, false, shapes);
    requireTrue(shapes.size() == 4, "negative width: 2 shapes");

    bad.addShapes(t, true, shapes);
    requireTrue(shapes.size() == 6, "NaN candle: 2 shapes");

    std::printf("  Test 5 (degenerate input) PASS\n");
  }

  std::printf("D2.2 candle shapes: ALL PASS\n");
  return 0;
}
