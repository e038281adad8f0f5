#include "geojson.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace impact::geo {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

const Value* Field(const Struct& object, const std::string& key) {
  const auto& fields = object.fields();
  auto        it     = fields.find(key);
  return it == fields.end() ? nullptr : &it->second;
}

const ListValue& RequireList(const Value* value, const std::string& what) {
  if (!value || !value->has_list_value()) {
    throw util::ValidationError("geojson: " + what + " must be an array");
  }
  return value->list_value();
}

LatLng ParsePosition(const Value& value) {
  if (!value.has_list_value() || value.list_value().values_size() < 2) {
    throw util::ValidationError("geojson: position must be [lon, lat]");
  }
  const auto& coords = value.list_value();
  for (int i = 0; i < 2; ++i) {
    if (coords.values(i).kind_case() != Value::kNumberValue) {
      throw util::ValidationError("geojson: position values must be numbers");
    }
  }

  // Any third value (altitude) is ignored.
  LatLng p{coords.values(1).number_value(), coords.values(0).number_value()};
  if (!IsValidCoordinate(p)) {
    throw util::ValidationError("geojson: coordinate out of range");
  }
  return p;
}

Ring ParseRing(const Value& value) {
  const auto& positions = RequireList(&value, "linear ring");

  Ring ring;
  ring.reserve(static_cast<size_t>(positions.values_size()));
  for (const auto& position : positions.values()) {
    ring.push_back(ParsePosition(position));
  }

  if (ring.size() < 4) {
    throw util::ValidationError("geojson: linear ring needs at least 4 positions");
  }
  if (!(ring.front() == ring.back())) {
    throw util::ValidationError("geojson: linear ring is not closed");
  }
  return ring;
}

Polygon ParsePolygon(const Value& value) {
  const auto& rings = RequireList(&value, "polygon coordinates");
  if (rings.values_size() == 0) {
    throw util::ValidationError("geojson: polygon has no rings");
  }

  Polygon polygon;
  polygon.outer = ParseRing(rings.values(0));
  for (int i = 1; i < rings.values_size(); ++i) {
    polygon.holes.push_back(ParseRing(rings.values(i)));
  }
  return polygon;
}

MultiPolygon ParseGeometry(const Struct& object, const GeoJsonOptions& options) {
  const Value* type = Field(object, "type");
  if (!type || type->kind_case() != Value::kStringValue) {
    throw util::ValidationError("geojson: missing type");
  }
  const std::string& kind = type->string_value();

  if (kind == "Feature") {
    const Value* geometry = Field(object, "geometry");
    if (!geometry || !geometry->has_struct_value()) {
      throw util::ValidationError("geojson: feature has no geometry");
    }
    return ParseGeometry(geometry->struct_value(), options);
  }

  const Value* coordinates = Field(object, "coordinates");

  if (kind == "Polygon") {
    if (!coordinates) {
      throw util::ValidationError("geojson: polygon has no coordinates");
    }
    return {ParsePolygon(*coordinates)};
  }

  if (kind == "MultiPolygon") {
    const auto&  polygons = RequireList(coordinates, "multipolygon coordinates");
    MultiPolygon out;
    for (const auto& polygon : polygons.values()) {
      out.push_back(ParsePolygon(polygon));
    }
    if (out.empty()) {
      throw util::ValidationError("geojson: multipolygon has no polygons");
    }
    return out;
  }

  if (kind == "Point") {
    if (!coordinates) {
      throw util::ValidationError("geojson: point has no coordinates");
    }
    if (options.point_buffer_m <= 0.0) {
      throw util::ValidationError("geojson: point buffer radius must be positive");
    }
    return {BufferPoint(ParsePosition(*coordinates), options.point_buffer_m)};
  }

  throw util::ValidationError("geojson: unsupported geometry type " + kind);
}

void AppendRing(const Ring& ring, ListValue* out) {
  for (const auto& p : ring) {
    auto* position = out->add_values()->mutable_list_value();
    position->add_values()->set_number_value(p.lon);
    position->add_values()->set_number_value(p.lat);
  }
}

void AppendPolygon(const Polygon& polygon, ListValue* out) {
  AppendRing(polygon.outer, out->add_values()->mutable_list_value());
  for (const auto& hole : polygon.holes) {
    AppendRing(hole, out->add_values()->mutable_list_value());
  }
}

} // namespace

MultiPolygon ParseGeoJson(std::string_view json, const GeoJsonOptions& options) {
  Value root;
  auto  status = google::protobuf::util::JsonStringToMessage(std::string(json), &root);
  if (!status.ok()) {
    throw util::ValidationError("geojson: " + std::string(status.message()));
  }
  if (!root.has_struct_value()) {
    throw util::ValidationError("geojson: top level must be an object");
  }
  return ParseGeometry(root.struct_value(), options);
}

std::string ToGeoJson(const MultiPolygon& geometry) {
  Struct object;
  auto&  fields = *object.mutable_fields();

  auto* coordinates = fields["coordinates"].mutable_list_value();
  if (geometry.size() == 1) {
    fields["type"].set_string_value("Polygon");
    AppendPolygon(geometry.front(), coordinates);
  } else {
    fields["type"].set_string_value("MultiPolygon");
    for (const auto& polygon : geometry) {
      AppendPolygon(polygon, coordinates->add_values()->mutable_list_value());
    }
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw std::runtime_error("geojson: failed to serialize geometry: " + std::string(status.message()));
  }
  return json;
}

} // namespace impact::geo
