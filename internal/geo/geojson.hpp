#pragma once

#include <string>
#include <string_view>

#include "internal/geo/geometry.hpp"

namespace impact::geo {

struct GeoJsonOptions {
  // Radius used to turn Point geometries into polygons.
  double point_buffer_m = 200.0;
};

/*
  Parses a GeoJSON Polygon, MultiPolygon or Point (optionally wrapped in a
  Feature) into a MultiPolygon. Positions are [lon, lat].

  Rings must be closed, have at least four positions and stay in range;
  anything else throws util::ValidationError.
*/
MultiPolygon ParseGeoJson(std::string_view json, const GeoJsonOptions& options = {});

// Polygon when there is exactly one, MultiPolygon otherwise.
std::string ToGeoJson(const MultiPolygon& geometry);

} // namespace impact::geo
