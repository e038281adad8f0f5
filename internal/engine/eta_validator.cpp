#include "eta_validator.hpp"

#include <chrono>
#include <cmath>
#include <optional>
#include <string>
#include <utility>

#include "internal/geo/geometry.hpp"
#include "internal/observability/logging.hpp"

namespace impact::engine {

namespace {

// A week of travel; longer ETAs come from bogus speeds or offsets.
constexpr double kMaxElapsedSec = 7.0 * 24 * 3600;

EtaVerdict Failed(std::string error) {
  EtaVerdict verdict;
  verdict.error = std::move(error);
  return verdict;
}

// Bearing across [first, last]; falls back to the neighbouring segment when
// the range has no length.
std::optional<double> RangeBearing(const std::vector<geo::LatLng>& points, const model::SegmentRange& range) {
  if (!(points[range.first] == points[range.last])) {
    return geo::InitialBearingDeg(points[range.first], points[range.last]);
  }
  for (std::size_t i = range.last + 1; i < points.size(); ++i) {
    if (!(points[i] == points[range.first])) {
      return geo::InitialBearingDeg(points[range.first], points[i]);
    }
  }
  for (std::size_t i = range.first; i-- > 0;) {
    if (!(points[i] == points[range.first])) {
      return geo::InitialBearingDeg(points[i], points[range.first]);
    }
  }
  return std::nullopt;
}

} // namespace

std::vector<double> CumulativeDistances(const std::vector<geo::LatLng>& points) {
  std::vector<double> out(points.size(), 0.0);
  for (std::size_t i = 1; i < points.size(); ++i) {
    out[i] = out[i - 1] + geo::HaversineMeters(points[i - 1], points[i]);
  }
  return out;
}

EtaValidator::EtaValidator(EtaOptions options) : options_(options) {
  if (options_.default_speed_kph <= 0.0) {
    options_.default_speed_kph = 60.0;
  }
  if (options_.direction_tolerance_deg <= 0.0) {
    options_.direction_tolerance_deg = 45.0;
  }
}

EtaVerdict EtaValidator::Validate(const model::Route& route, const model::Intersection& intersection, util::TimePoint departure) const {
  return Validate(route, CumulativeDistances(route.points), intersection, departure);
}

EtaVerdict EtaValidator::Validate(const model::Route& route, const std::vector<double>& cumulative, const model::Intersection& intersection,
                                  util::TimePoint departure) const {
  if (!intersection.event) {
    return Failed("intersection has no event");
  }
  if (intersection.ranges.empty()) {
    return Failed("intersection has no ranges");
  }

  EtaVerdict first;
  for (std::size_t i = 0; i < intersection.ranges.size(); ++i) {
    auto verdict        = ValidateRange(route, cumulative, *intersection.event, intersection.ranges[i], departure);
    verdict.range_index = i;

    if (!verdict.error.empty()) {
      IMPACT_LOG_WARN("eta validation failed, treating event as not affecting",
                      {observability::StringField("route_id", route.id), observability::StringField("event_id", intersection.event->id),
                       observability::StringField("error", verdict.error)});
    }
    if (verdict.is_affecting) {
      return verdict;
    }
    if (i == 0) {
      first = std::move(verdict);
    }
  }
  return first;
}

EtaVerdict EtaValidator::ValidateRange(const model::Route& route, const std::vector<double>& cumulative, const model::Event& event,
                                       const model::SegmentRange& range, util::TimePoint departure) const {
  const auto& points = route.points;
  if (points.size() < 2) {
    return Failed("route has fewer than two vertices");
  }
  if (cumulative.size() != points.size()) {
    return Failed("distance table does not match route");
  }
  if (range.first > range.last || range.last >= points.size()) {
    return Failed("degenerate segment range");
  }
  if (cumulative.back() <= 0.0) {
    return Failed("zero-length route");
  }

  double elapsed_sec = 0.0;
  if (route.vertex_offsets_sec.size() == points.size()) {
    elapsed_sec = (route.vertex_offsets_sec[range.first] + route.vertex_offsets_sec[range.last]) / 2.0;
  } else {
    const double speed_kph = route.average_speed_kph > 0.0 ? route.average_speed_kph : options_.default_speed_kph;
    const double meters    = (cumulative[range.first] + cumulative[range.last]) / 2.0;
    elapsed_sec            = meters / (speed_kph * 1000.0 / 3600.0);
  }
  if (!std::isfinite(elapsed_sec) || elapsed_sec < 0.0) {
    return Failed("invalid elapsed time");
  }
  if (elapsed_sec > kMaxElapsedSec) {
    return Failed("elapsed time out of range");
  }

  EtaVerdict verdict;
  verdict.eta = departure + std::chrono::duration_cast<util::Clock::duration>(std::chrono::duration<double>(elapsed_sec));

  if (!event.IsActiveAt(verdict.eta)) {
    return verdict;
  }

  if (event.directionality) {
    const auto direction = geo::ParseDirection(*event.directionality);
    if (!direction) {
      verdict.error = "unknown direction '" + *event.directionality + "'";
      return verdict;
    }
    if (!direction->any_direction) {
      const auto bearing = RangeBearing(points, range);
      if (!bearing) {
        verdict.error = "cannot determine route bearing";
        return verdict;
      }
      if (geo::BearingDifferenceDeg(*bearing, *direction->bearing_deg) > options_.direction_tolerance_deg) {
        return verdict;
      }
    }
  }

  verdict.is_affecting = true;
  return verdict;
}

} // namespace impact::engine
