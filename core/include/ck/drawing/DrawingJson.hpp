#pragma once
#include "ck/drawing/Drawing.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace ck {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

// One drawing as {"id","type","isVisible","style",<geometry fields>}.
// Geometry fields mirror the payload names: price, time, start, end, p2,
// point, text, anchor, label, entry, profit, stop, points.
void writeDrawing(JsonWriter& w, const Drawing& d);

// Returns false if the object is not a drawing (unknown type, missing id or
// required geometry). Ids may be numbers or decimal strings.
bool readDrawing(const rapidjson::Value& v, Drawing& out);

void writePoint(JsonWriter& w, const Point& p);
bool readPoint(const rapidjson::Value& v, const char* key, Point& out);

} // namespace ck
