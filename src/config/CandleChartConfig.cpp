#include "sp/config/CandleChartConfig.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>

namespace sp {

std::string serializeCandleChartConfig(const CandleChartConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version",
                rapidjson::Value(config.version.c_str(), alloc), alloc);
  doc.AddMember("name",
                rapidjson::Value(config.name.c_str(), alloc), alloc);

  doc.AddMember("candleWidth", config.candleWidth, alloc);
  doc.AddMember("whiskerWidth", config.whiskerWidth, alloc);
  doc.AddMember("strokeWidth", static_cast<double>(config.strokeWidth), alloc);
  doc.AddMember("spacing", config.spacing, alloc);
  doc.AddMember("origin", config.origin, alloc);

  doc.AddMember("theme",
                rapidjson::Value(config.themeName.c_str(), alloc), alloc);
  doc.AddMember("showX", config.showX, alloc);
  doc.AddMember("showY", config.showY, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeCandleChartConfig(const std::string& json, CandleChartConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "[CandleChartConfig] not a JSON object (offset %zu)\n",
                 doc.HasParseError() ? doc.GetErrorOffset() : static_cast<std::size_t>(0));
    return false;
  }

  CandleChartConfig cfg = out;

  if (doc.HasMember("version") && doc["version"].IsString())
    cfg.version = doc["version"].GetString();
  if (doc.HasMember("name") && doc["name"].IsString())
    cfg.name = doc["name"].GetString();

  // Geometry
  if (doc.HasMember("candleWidth") && doc["candleWidth"].IsNumber())
    cfg.candleWidth = doc["candleWidth"].GetDouble();
  if (doc.HasMember("whiskerWidth") && doc["whiskerWidth"].IsNumber())
    cfg.whiskerWidth = doc["whiskerWidth"].GetDouble();
  if (doc.HasMember("strokeWidth") && doc["strokeWidth"].IsNumber())
    cfg.strokeWidth = static_cast<float>(doc["strokeWidth"].GetDouble());
  if (doc.HasMember("spacing") && doc["spacing"].IsNumber())
    cfg.spacing = doc["spacing"].GetDouble();
  if (doc.HasMember("origin") && doc["origin"].IsNumber())
    cfg.origin = doc["origin"].GetDouble();

  // Theme
  if (doc.HasMember("theme") && doc["theme"].IsString())
    cfg.themeName = doc["theme"].GetString();

  // Hover rulers
  if (doc.HasMember("showX") && doc["showX"].IsBool())
    cfg.showX = doc["showX"].GetBool();
  if (doc.HasMember("showY") && doc["showY"].IsBool())
    cfg.showY = doc["showY"].GetBool();

  out = cfg;
  return true;
}

} // namespace sp
