#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/geo/geometry.hpp"
#include "internal/model/event.hpp"

namespace impact::model {

struct Route {
  std::string               id;
  std::vector<geo::LatLng>  points;

  // Zero means "use the configured default".
  double average_speed_kph = 0.0;

  // Elapsed seconds from departure at each vertex. Used only when it has one
  // entry per point.
  std::vector<double> vertex_offsets_sec;

  bool truncated = false;
};

// Inclusive vertex indices [first, last] of one contiguous intersecting run.
struct SegmentRange {
  std::size_t first = 0;
  std::size_t last  = 0;

  bool operator==(const SegmentRange&) const = default;
};

struct Intersection {
  std::string                  route_id;
  std::shared_ptr<const Event> event;
  std::vector<SegmentRange>    ranges;
};

} // namespace impact::model
