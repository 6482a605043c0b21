#include "sp/data/CandleData.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>
#include <utility>

namespace sp {

static bool readNumber(const rapidjson::Value& obj, const char* key, double& out) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsNumber()) return false;
  out = it->value.GetDouble();
  return true;
}

static bool readCandle(const rapidjson::Value& v, Candle& c) {
  if (v.IsArray()) {
    const auto& a = v.GetArray();
    if (a.Size() != 5) return false;
    for (unsigned i = 0; i < 5; ++i) {
      if (!a[i].IsNumber()) return false;
    }
    c = Candle(a[0].GetDouble(), a[1].GetDouble(), a[2].GetDouble(),
               a[3].GetDouble(), a[4].GetDouble());
    return true;
  }

  if (v.IsObject()) {
    Candle r;
    if (!readNumber(v, "o", r.open)) return false;
    if (!readNumber(v, "h", r.high)) return false;
    if (!readNumber(v, "l", r.low)) return false;
    if (!readNumber(v, "c", r.close)) return false;
    // Volume is optional in object form
    if (v.HasMember("v") && !readNumber(v, "v", r.volume)) return false;
    c = r;
    return true;
  }

  return false;
}

bool parseCandlesJSON(const std::string& json, std::vector<Candle>& out) {
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseNanAndInfFlag>(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    std::fprintf(stderr, "[CandleData] invalid JSON object\n");
    return false;
  }
  if (!doc.HasMember("candles") || !doc["candles"].IsArray()) {
    std::fprintf(stderr, "[CandleData] missing \"candles\" array\n");
    return false;
  }

  const auto& arr = doc["candles"].GetArray();

  std::vector<Candle> loaded;
  loaded.reserve(arr.Size());

  for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
    Candle c;
    if (!readCandle(arr[i], c)) {
      std::fprintf(stderr, "[CandleData] malformed candle at index %u\n",
                   static_cast<unsigned>(i));
      return false;
    }
    loaded.push_back(c);
  }

  out = std::move(loaded);
  return true;
}

std::string candlesToJSON(const std::vector<Candle>& candles) {
  // NaN and Infinity are written as literals that parseCandlesJSON accepts
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                    rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag> w(sb);

  w.StartObject();
  w.Key("candles");
  w.StartArray();
  for (const auto& c : candles) {
    w.StartArray();
    w.Double(c.open);
    w.Double(c.high);
    w.Double(c.low);
    w.Double(c.close);
    w.Double(c.volume);
    w.EndArray();
  }
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

} // namespace sp
