// D4.1: CandleChartConfig JSON + theme presets
// Tests: serialize → deserialize preserves fields, missing keys keep
// defaults, invalid JSON → false with output untouched, themeByName.

#include "sp/config/CandleChartConfig.hpp"
#include "sp/style/Theme.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // --- Test 1: serialized config reads back ---
  {
    sp::CandleChartConfig cfg;
    cfg.name = "ETHUSD";
    cfg.candleWidth = 0.6;
    cfg.whiskerWidth = 0.05;
    cfg.strokeWidth = 2.0f;
    cfg.spacing = 60.0;
    cfg.origin = 1700000000.0;
    cfg.themeName = "Light";
    cfg.showX = false;

    std::string json = sp::serializeCandleChartConfig(cfg);
    requireTrue(json.find("\"name\":\"ETHUSD\"") != std::string::npos, "name in JSON");

    sp::CandleChartConfig out;
    requireTrue(sp::deserializeCandleChartConfig(json, out), "deserialize ok");
    requireTrue(out.name == "ETHUSD", "name");
    requireTrue(out.candleWidth == 0.6, "candleWidth");
    requireTrue(out.whiskerWidth == 0.05, "whiskerWidth");
    requireTrue(out.strokeWidth == 2.0f, "strokeWidth");
    requireTrue(out.spacing == 60.0, "spacing");
    requireTrue(out.origin == 1700000000.0, "origin");
    requireTrue(out.themeName == "Light", "theme");
    requireTrue(!out.showX && out.showY, "ruler flags");

    std::printf("  Test 1 (serialize/deserialize) PASS\n");
  }

  // --- Test 2: partial document keeps defaults ---
  {
    sp::CandleChartConfig out;
    requireTrue(sp::deserializeCandleChartConfig(R"({"candleWidth":0.4,"showY":false})", out),
                "partial ok");
    requireTrue(out.candleWidth == 0.4, "candleWidth read");
    requireTrue(!out.showY, "showY read");
    requireTrue(out.whiskerWidth == 0.15, "whiskerWidth default kept");
    requireTrue(out.themeName == "Dark", "theme default kept");

    // Wrong types are ignored
    requireTrue(sp::deserializeCandleChartConfig(R"({"spacing":"wide"})", out), "wrong type ok");
    requireTrue(out.spacing == 1.0, "wrong-typed key ignored");

    std::printf("  Test 2 (partial) PASS\n");
  }

  // --- Test 3: invalid input ---
  {
    sp::CandleChartConfig out;
    out.name = "keep";
    requireTrue(!sp::deserializeCandleChartConfig("{not json", out), "parse error → false");
    requireTrue(!sp::deserializeCandleChartConfig("[1,2,3]", out), "array → false");
    requireTrue(out.name == "keep", "output untouched on failure");

    std::printf("  Test 3 (invalid) PASS\n");
  }

  // --- Test 4: theme presets ---
  {
    sp::Theme dark = sp::themeByName("Dark");
    sp::Theme light = sp::themeByName("Light");
    sp::Theme other = sp::themeByName("Solarized");
    requireTrue(dark.name == "Dark", "dark preset");
    requireTrue(light.name == "Light", "light preset");
    requireTrue(other.name == "Dark", "unknown → dark");
    requireTrue(dark.candleUp != dark.candleDown, "up/down differ");
    requireTrue(light.textColor != dark.textColor, "presets differ");

    std::printf("  Test 4 (themes) PASS\n");
  }

  std::printf("D4.1 chart config: ALL PASS\n");
  return 0;
}
