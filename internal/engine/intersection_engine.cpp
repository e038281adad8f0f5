#include "intersection_engine.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace impact::engine {

namespace {

struct PreparedPolygon {
  const geo::Polygon* polygon = nullptr;
  geo::BoundingBox    bounds;
};

std::vector<PreparedPolygon> Prepare(const model::Event& event) {
  std::vector<PreparedPolygon> out;
  out.reserve(event.geometry.size());
  for (const auto& polygon : event.geometry) {
    if (polygon.outer.empty()) continue;
    out.push_back({&polygon, geo::BoundsOf(polygon.outer)});
  }
  return out;
}

std::vector<model::SegmentRange> ToRanges(const std::vector<bool>& hit) {
  std::vector<model::SegmentRange> ranges;
  std::size_t                      i = 0;
  while (i < hit.size()) {
    if (!hit[i]) {
      ++i;
      continue;
    }
    const std::size_t start = i;
    while (i < hit.size() && hit[i]) ++i;
    // segments [start, i) span vertices [start, i]
    ranges.push_back({start, i});
  }
  return ranges;
}

} // namespace

IntersectionEngine::IntersectionEngine(IntersectionOptions options) : options_(options) {
  if (options_.max_route_vertices < 2) {
    options_.max_route_vertices = 2;
  }
  if (options_.cancel_check_interval == 0) {
    options_.cancel_check_interval = 256;
  }
}

bool IntersectionEngine::Truncate(model::Route& route) const {
  if (route.points.size() <= options_.max_route_vertices) {
    return false;
  }

  IMPACT_LOG_WARN("route exceeds vertex limit, truncating",
                  {observability::StringField("route_id", route.id),
                   observability::IntField("vertices", static_cast<int64_t>(route.points.size())),
                   observability::IntField("limit", static_cast<int64_t>(options_.max_route_vertices))});

  route.points.resize(options_.max_route_vertices);
  if (route.vertex_offsets_sec.size() > options_.max_route_vertices) {
    route.vertex_offsets_sec.resize(options_.max_route_vertices);
  }
  route.truncated = true;
  return true;
}

std::vector<model::Intersection> IntersectionEngine::Intersect(const model::Route& route, const store::EventSnapshot& candidates,
                                                               const CancellationToken& cancel) const {
  std::vector<model::Intersection> out;
  if (route.points.empty()) {
    return out;
  }

  const auto  route_bounds = geo::BoundsOf(route.points);
  std::size_t work         = 0;

  for (const auto& event : candidates) {
    if (!event || !event->bbox.Overlaps(route_bounds)) {
      continue;
    }

    auto ranges = MatchEvent(route, *event, cancel, work);
    if (!ranges.empty()) {
      out.push_back({route.id, event, std::move(ranges)});
    }
  }
  return out;
}

std::vector<model::SegmentRange> IntersectionEngine::MatchEvent(const model::Route& route, const model::Event& event,
                                                                const CancellationToken& cancel, std::size_t& work) const {
  const auto polygons = Prepare(event);
  const auto& points  = route.points;

  if (points.size() == 1) {
    for (const auto& p : polygons) {
      if (p.bounds.Contains(points[0]) && geo::PolygonContains(*p.polygon, points[0])) {
        return {{0, 0}};
      }
    }
    return {};
  }

  std::vector<bool> hit(points.size() - 1, false);
  for (std::size_t i = 0; i + 1 < points.size(); ++i) {
    if (++work % options_.cancel_check_interval == 0 && cancel.IsCancelled()) {
      throw util::DeadlineExceeded("route " + route.id + " cancelled during intersection");
    }

    auto segment_bounds = geo::BoundingBox::Of(points[i]);
    segment_bounds.Extend(points[i + 1]);
    if (!segment_bounds.Overlaps(event.bbox)) {
      continue;
    }

    for (const auto& p : polygons) {
      if (segment_bounds.Overlaps(p.bounds) && geo::SegmentTouchesPolygon(points[i], points[i + 1], *p.polygon)) {
        hit[i] = true;
        break;
      }
    }
  }
  return ToRanges(hit);
}

} // namespace impact::engine
