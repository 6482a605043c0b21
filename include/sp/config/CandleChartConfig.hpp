#pragma once
#include <string>

namespace sp {

// Serializable per-chart settings.
struct CandleChartConfig {
  std::string version{"1.0"};
  std::string name;            // e.g. "BTCUSD"
  double candleWidth{0.25};
  double whiskerWidth{0.15};
  float strokeWidth{1.0f};
  double spacing{1.0};         // x distance between consecutive candles
  double origin{0.0};          // x of the first candle
  std::string themeName{"Dark"};
  bool showX{true};
  bool showY{true};
};

// Serialize CandleChartConfig to a JSON string.
std::string serializeCandleChartConfig(const CandleChartConfig& config);

// Deserialize a JSON string into CandleChartConfig. Missing keys keep their
// current values. Returns false on error, leaving out untouched.
bool deserializeCandleChartConfig(const std::string& json, CandleChartConfig& out);

} // namespace sp
