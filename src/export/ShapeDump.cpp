#include "sp/export/ShapeDump.hpp"

#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cmath>

namespace sp {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// Degenerate geometry (NaN candles) keeps the document valid: non-finite -> null
static void writeNumber(JsonWriter& w, double v) {
  if (std::isfinite(v)) w.Double(v);
  else w.Null();
}

static void writePos(JsonWriter& w, const Pos2& p) {
  w.StartArray();
  writeNumber(w, static_cast<double>(p.x));
  writeNumber(w, static_cast<double>(p.y));
  w.EndArray();
}

static void writeColor(JsonWriter& w, const Color& c) {
  w.StartArray();
  writeNumber(w, static_cast<double>(c.r));
  writeNumber(w, static_cast<double>(c.g));
  writeNumber(w, static_cast<double>(c.b));
  writeNumber(w, static_cast<double>(c.a));
  w.EndArray();
}

static void writeStroke(JsonWriter& w, const Stroke& s) {
  w.Key("strokeWidth"); writeNumber(w, static_cast<double>(s.width));
  w.Key("strokeColor"); writeColor(w, s.color);
}

std::string shapesToJSON(const std::vector<Shape>& shapes) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);

  w.StartObject();
  w.Key("shapes");
  w.StartArray();
  for (const auto& s : shapes) {
    w.StartObject();
    w.Key("kind"); w.String(toString(s.kind));
    switch (s.kind) {
      case ShapeKind::Rect:
        w.Key("min"); writePos(w, s.rect.min);
        w.Key("max"); writePos(w, s.rect.max);
        w.Key("rounding"); writeNumber(w, static_cast<double>(s.rounding));
        w.Key("fill"); writeColor(w, s.fill);
        writeStroke(w, s.stroke);
        break;
      case ShapeKind::LineSegment:
        w.Key("p0"); writePos(w, s.points[0]);
        w.Key("p1"); writePos(w, s.points[1]);
        writeStroke(w, s.stroke);
        break;
      case ShapeKind::Text:
        w.Key("pos"); writePos(w, s.pos);
        w.Key("anchor");
        w.String(s.anchor == TextAnchor::LeftBottom ? "leftBottom" : "leftTop");
        w.Key("text");
        w.String(s.text.c_str(), static_cast<rapidjson::SizeType>(s.text.size()));
        w.Key("color"); writeColor(w, s.textColor);
        break;
    }
    w.EndObject();
  }
  w.EndArray();
  w.EndObject();

  return sb.GetString();
}

} // namespace sp
