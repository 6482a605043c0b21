// Candle hover demo
// Builds a candle chart (from JSON files or fake data), fits the view to it,
// emits one frame of shapes with the hover overlay for a pointer position,
// and writes the frame as JSON.
//
// Usage: d1_candle_hover_demo [config.json] [candles.json] [out.json]

#include "sp/config/CandleChartConfig.hpp"
#include "sp/data/CandleData.hpp"
#include "sp/export/ShapeDump.hpp"
#include "sp/items/CandleChart.hpp"
#include "sp/style/Theme.hpp"
#include "sp/viewport/ScreenTransform.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

static bool readFile(const char* path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::fprintf(stderr, "[demo] cannot open %s\n", path);
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

// ---- Fake OHLCV data generation ----

static std::vector<sp::Candle> generateCandles(int count) {
  std::vector<sp::Candle> candles;

  double price = 100.0;
  std::uint32_t seed = 42;

  auto rng = [&]() -> double {
    seed = seed * 1103515245u + 12345u;
    return static_cast<double>((seed >> 16) & 0x7FFF) / 32767.0;
  };

  for (int i = 0; i < count; i++) {
    double change = (rng() - 0.5) * 4.0;
    double open = price;
    double close = price + change;
    double high = std::fmax(open, close) + rng() * 2.0;
    double low  = std::fmin(open, close) - rng() * 2.0;
    double volume = 1000.0 + rng() * 500.0;
    price = close;

    candles.emplace_back(open, high, low, close, volume);
  }
  return candles;
}

int main(int argc, char** argv) {
  constexpr float W = 800.0f;
  constexpr float H = 600.0f;
  constexpr int NUM_CANDLES = 50;

  // 1. Configuration
  sp::CandleChartConfig config;
  config.name = "Demo";
  if (argc > 1) {
    std::string text;
    if (!readFile(argv[1], text)) return 1;
    if (!sp::deserializeCandleChartConfig(text, config)) return 1;
  }

  // 2. Data
  std::vector<sp::Candle> candles;
  if (argc > 2) {
    std::string text;
    if (!readFile(argv[2], text)) return 1;
    if (!sp::parseCandlesJSON(text, candles)) return 1;
  } else {
    candles = generateCandles(NUM_CANDLES);
  }

  sp::Theme theme = sp::themeByName(config.themeName);
  sp::CandleChart chart = sp::CandleChart::fromCandles(config.name, candles, config, theme);

  // 3. Fit view to data
  sp::PlotBounds bounds = chart.bounds();
  if (!bounds.isValid()) {
    std::fprintf(stderr, "[demo] no candles to show\n");
    return 1;
  }
  bounds.addRelativeMargin(0.05);

  sp::ScreenTransform transform(sp::ScreenRect{{0.0f, 0.0f}, {W, H}}, bounds);

  // 4. Frame: all candles, then hover overlay for a pointer in the middle
  std::vector<sp::Shape> shapes;
  chart.addShapes(transform, shapes);

  chart.setElementFormatter([](const sp::CandleElem& e, const sp::CandleChart& parent) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "%s @ %.0f\nClose = %.2f",
                  parent.name().c_str(), e.x, e.candle.close);
    return std::string(buf);
  });

  sp::Pos2 pointer{W * 0.5f, H * 0.5f};
  sp::ClosestElem closest = chart.findClosest(pointer, transform);
  if (closest.found) {
    sp::PlotConfig plot{transform, config.showX, config.showY,
                        theme.rulerColor, theme.textColor};
    chart.onHover(closest.index, plot, shapes);
  }

  std::string json = sp::shapesToJSON(shapes);

  // 5. Output
  if (argc > 3) {
    std::ofstream out(argv[3], std::ios::binary);
    if (!out) {
      std::fprintf(stderr, "[demo] cannot open %s for writing\n", argv[3]);
      return 1;
    }
    out << json;
    std::printf("Wrote %s (%zu shapes)\n", argv[3], shapes.size());
  } else {
    std::printf("%s\n", json.c_str());
  }
  return 0;
}
