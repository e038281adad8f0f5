#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/model/route.hpp"
#include "internal/util/time.hpp"

namespace impact::engine {

struct EtaOptions {
  double default_speed_kph       = 60.0;
  double direction_tolerance_deg = 45.0;
};

struct EtaVerdict {
  bool            is_affecting = false;
  util::TimePoint eta{};

  // Index into Intersection::ranges that decided the verdict.
  std::size_t range_index = 0;

  // Set when the computation failed; the verdict is then non-affecting.
  std::string error;
};

// Distance in meters from the first vertex to each vertex.
std::vector<double> CumulativeDistances(const std::vector<geo::LatLng>& points);

/*
  Temporal and directional check of one intersection.

  eta = departure + time to reach the middle of the intersecting range,
  from per-vertex offsets when the route carries one per point, otherwise
  from distance / speed. The event affects the route when
  start <= eta <= expires and, if it names a direction, the route bearing
  across the range is within the tolerance of it.

  Fails closed: any computation error yields is_affecting = false.
  With several ranges the first affecting one wins.
*/
class EtaValidator {
 public:
  explicit EtaValidator(EtaOptions options = {});

  EtaVerdict Validate(const model::Route& route, const model::Intersection& intersection, util::TimePoint departure) const;

  // cumulative must come from CumulativeDistances(route.points).
  EtaVerdict Validate(const model::Route& route, const std::vector<double>& cumulative, const model::Intersection& intersection,
                      util::TimePoint departure) const;

  const EtaOptions& options() const {
    return options_;
  }

 private:
  EtaVerdict ValidateRange(const model::Route& route, const std::vector<double>& cumulative, const model::Event& event,
                           const model::SegmentRange& range, util::TimePoint departure) const;

  EtaOptions options_;
};

} // namespace impact::engine
