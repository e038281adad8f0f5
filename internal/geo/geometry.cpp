#include "geometry.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace impact::geo {

namespace {

constexpr double kEarthRadiusMeters = 6371008.8;
constexpr double kPi                = 3.14159265358979323846;
constexpr double kEpsilon           = 1e-12;

double ToRadians(double deg) {
  return deg * kPi / 180.0;
}

double ToDegrees(double rad) {
  return rad * 180.0 / kPi;
}

// > 0 counter-clockwise, < 0 clockwise, 0 collinear. x = lon, y = lat.
double Orientation(const LatLng& p, const LatLng& q, const LatLng& r) {
  return (q.lon - p.lon) * (r.lat - p.lat) - (q.lat - p.lat) * (r.lon - p.lon);
}

int Sign(double v) {
  if (v > kEpsilon) return 1;
  if (v < -kEpsilon) return -1;
  return 0;
}

bool OnSegment(const LatLng& p, const LatLng& q, const LatLng& r) {
  return std::min(p.lon, r.lon) - kEpsilon <= q.lon && q.lon <= std::max(p.lon, r.lon) + kEpsilon &&
         std::min(p.lat, r.lat) - kEpsilon <= q.lat && q.lat <= std::max(p.lat, r.lat) + kEpsilon;
}

bool RingEdgesCross(const Ring& ring, const LatLng& a, const LatLng& b) {
  for (std::size_t i = 0; i + 1 < ring.size(); ++i) {
    if (SegmentsIntersect(a, b, ring[i], ring[i + 1])) {
      return true;
    }
  }
  return false;
}

std::string Normalize(std::string_view name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    if (c == ' ' || c == '-' || c == '_') continue;
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

} // namespace

void BoundingBox::Extend(const BoundingBox& other) {
  min_lon = std::min(min_lon, other.min_lon);
  min_lat = std::min(min_lat, other.min_lat);
  max_lon = std::max(max_lon, other.max_lon);
  max_lat = std::max(max_lat, other.max_lat);
}

void BoundingBox::Extend(const LatLng& p) {
  Extend(BoundingBox::Of(p));
}

bool IsValidCoordinate(const LatLng& p) {
  return std::isfinite(p.lat) && std::isfinite(p.lon) && p.lat >= -90.0 && p.lat <= 90.0 && p.lon >= -180.0 && p.lon <= 180.0;
}

void ValidateBoundingBox(const BoundingBox& box) {
  if (!IsValidCoordinate({box.min_lat, box.min_lon}) || !IsValidCoordinate({box.max_lat, box.max_lon})) {
    throw util::ValidationError("bounding box coordinates out of range");
  }
  if (box.min_lon > box.max_lon) {
    throw util::ValidationError("bounding box min_lon is greater than max_lon");
  }
  if (box.min_lat > box.max_lat) {
    throw util::ValidationError("bounding box min_lat is greater than max_lat");
  }
}

BoundingBox BoundsOf(const std::vector<LatLng>& points) {
  if (points.empty()) {
    return {};
  }
  auto box = BoundingBox::Of(points.front());
  for (const auto& p : points) {
    box.Extend(p);
  }
  return box;
}

BoundingBox BoundsOf(const MultiPolygon& geometry) {
  bool        first = true;
  BoundingBox box;
  for (const auto& polygon : geometry) {
    if (polygon.outer.empty()) continue;
    const auto ring_box = BoundsOf(polygon.outer);
    if (first) {
      box   = ring_box;
      first = false;
    } else {
      box.Extend(ring_box);
    }
  }
  return box;
}

bool RingContains(const Ring& ring, const LatLng& p) {
  if (ring.size() < 4) return false;

  bool inside = false;
  for (std::size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
    const auto& a = ring[i];
    const auto& b = ring[j];
    if (Sign(Orientation(a, b, p)) == 0 && OnSegment(a, p, b)) {
      return true;
    }
    if (((a.lat > p.lat) != (b.lat > p.lat)) && (p.lon < (b.lon - a.lon) * (p.lat - a.lat) / (b.lat - a.lat) + a.lon)) {
      inside = !inside;
    }
  }
  return inside;
}

bool PolygonContains(const Polygon& polygon, const LatLng& p) {
  if (!RingContains(polygon.outer, p)) {
    return false;
  }
  for (const auto& hole : polygon.holes) {
    if (RingContains(hole, p)) {
      // On the hole's edge is still on the polygon boundary.
      for (std::size_t i = 0; i + 1 < hole.size(); ++i) {
        if (Sign(Orientation(hole[i], hole[i + 1], p)) == 0 && OnSegment(hole[i], p, hole[i + 1])) {
          return true;
        }
      }
      return false;
    }
  }
  return true;
}

bool MultiPolygonContains(const MultiPolygon& geometry, const LatLng& p) {
  return std::any_of(geometry.begin(), geometry.end(), [&](const Polygon& polygon) { return PolygonContains(polygon, p); });
}

bool SegmentsIntersect(const LatLng& a1, const LatLng& a2, const LatLng& b1, const LatLng& b2) {
  const int o1 = Sign(Orientation(a1, a2, b1));
  const int o2 = Sign(Orientation(a1, a2, b2));
  const int o3 = Sign(Orientation(b1, b2, a1));
  const int o4 = Sign(Orientation(b1, b2, a2));

  if (o1 != o2 && o3 != o4) return true;

  if (o1 == 0 && OnSegment(a1, b1, a2)) return true;
  if (o2 == 0 && OnSegment(a1, b2, a2)) return true;
  if (o3 == 0 && OnSegment(b1, a1, b2)) return true;
  if (o4 == 0 && OnSegment(b1, a2, b2)) return true;

  return false;
}

bool SegmentTouchesPolygon(const LatLng& a, const LatLng& b, const Polygon& polygon) {
  if (PolygonContains(polygon, a) || PolygonContains(polygon, b)) {
    return true;
  }
  if (RingEdgesCross(polygon.outer, a, b)) {
    return true;
  }
  return std::any_of(polygon.holes.begin(), polygon.holes.end(), [&](const Ring& hole) { return RingEdgesCross(hole, a, b); });
}

double HaversineMeters(const LatLng& a, const LatLng& b) {
  const double lat1 = ToRadians(a.lat);
  const double lat2 = ToRadians(b.lat);
  const double dlat = lat2 - lat1;
  const double dlon = ToRadians(b.lon - a.lon);

  const double h = std::sin(dlat / 2) * std::sin(dlat / 2) + std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2) * std::sin(dlon / 2);
  return 2.0 * kEarthRadiusMeters * std::asin(std::min(1.0, std::sqrt(h)));
}

double InitialBearingDeg(const LatLng& from, const LatLng& to) {
  const double lat1 = ToRadians(from.lat);
  const double lat2 = ToRadians(to.lat);
  const double dlon = ToRadians(to.lon - from.lon);

  const double y       = std::sin(dlon) * std::cos(lat2);
  const double x       = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  const double bearing = ToDegrees(std::atan2(y, x));
  return std::fmod(bearing + 360.0, 360.0);
}

double BearingDifferenceDeg(double a, double b) {
  const double diff = std::fmod(std::fabs(a - b), 360.0);
  return diff > 180.0 ? 360.0 - diff : diff;
}

Polygon BufferPoint(const LatLng& center, double radius_m, int segments) {
  segments = std::max(segments, 4);

  const double lat_rad    = ToRadians(center.lat);
  const double dlat_deg   = ToDegrees(radius_m / kEarthRadiusMeters);
  const double cos_lat    = std::max(std::cos(lat_rad), 1e-6);
  const double dlon_deg   = ToDegrees(radius_m / (kEarthRadiusMeters * cos_lat));

  Polygon polygon;
  polygon.outer.reserve(static_cast<std::size_t>(segments) + 1);
  for (int i = 0; i < segments; ++i) {
    const double theta = 2.0 * kPi * static_cast<double>(i) / static_cast<double>(segments);
    LatLng       p;
    p.lat = std::clamp(center.lat + dlat_deg * std::sin(theta), -90.0, 90.0);
    p.lon = std::clamp(center.lon + dlon_deg * std::cos(theta), -180.0, 180.0);
    polygon.outer.push_back(p);
  }
  polygon.outer.push_back(polygon.outer.front());
  return polygon;
}

std::optional<Direction> ParseDirection(std::string_view name) {
  auto key = Normalize(name);
  if (key.empty() || key == "both" || key == "all" || key == "bothdirections" || key == "alldirections" || key == "bidirectional") {
    return Direction{true, std::nullopt};
  }

  static constexpr std::string_view kSuffix = "bound";
  if (key.size() > kSuffix.size() && key.compare(key.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0) {
    key.resize(key.size() - kSuffix.size());
  }

  static constexpr std::array<std::pair<std::string_view, double>, 20> kNames = {{
      {"n", 0.0},         {"nb", 0.0},          {"north", 0.0},       {"ne", 45.0},   {"northeast", 45.0},
      {"e", 90.0},        {"eb", 90.0},         {"east", 90.0},       {"se", 135.0},  {"southeast", 135.0},
      {"s", 180.0},       {"sb", 180.0},        {"south", 180.0},     {"sw", 225.0},  {"southwest", 225.0},
      {"w", 270.0},       {"wb", 270.0},        {"west", 270.0},      {"nw", 315.0},  {"northwest", 315.0},
  }};

  for (const auto& [label, bearing] : kNames) {
    if (key == label) {
      return Direction{false, bearing};
    }
  }
  return std::nullopt;
}

} // namespace impact::geo
