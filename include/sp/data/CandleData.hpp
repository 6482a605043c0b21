#pragma once
#include "sp/items/CandleElem.hpp"

#include <string>
#include <vector>

namespace sp {

// Load OHLCV records from JSON:
//   {"candles":[[open,high,low,close,volume], ...]}
// or with objects {"o":..,"h":..,"l":..,"c":..,"v":..} per record.
// Any malformed record fails the whole load; out is left untouched on failure.
bool parseCandlesJSON(const std::string& json, std::vector<Candle>& out);

// Inverse of parseCandlesJSON (array form).
std::string candlesToJSON(const std::vector<Candle>& candles);

} // namespace sp
