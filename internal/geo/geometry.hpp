#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace impact::geo {

struct LatLng {
  double lat = 0.0;
  double lon = 0.0;
};

inline bool operator==(const LatLng& a, const LatLng& b) {
  return a.lat == b.lat && a.lon == b.lon;
}

/*
  Axis-aligned box in degrees. No antimeridian wrapping: min_lon <= max_lon.
*/
struct BoundingBox {
  double min_lon = 0.0;
  double min_lat = 0.0;
  double max_lon = 0.0;
  double max_lat = 0.0;

  bool Overlaps(const BoundingBox& other) const {
    return max_lon >= other.min_lon && min_lon <= other.max_lon && max_lat >= other.min_lat && min_lat <= other.max_lat;
  }

  bool Contains(const LatLng& p) const {
    return p.lon >= min_lon && p.lon <= max_lon && p.lat >= min_lat && p.lat <= max_lat;
  }

  void Extend(const BoundingBox& other);
  void Extend(const LatLng& p);

  static BoundingBox Of(const LatLng& p) {
    return {p.lon, p.lat, p.lon, p.lat};
  }
};

using Ring = std::vector<LatLng>;

// First ring is the outer boundary, the rest are holes. Rings are closed.
struct Polygon {
  Ring              outer;
  std::vector<Ring> holes;
};

using MultiPolygon = std::vector<Polygon>;

// Throws util::ValidationError on out-of-range coordinates or min > max.
void ValidateBoundingBox(const BoundingBox& box);
bool IsValidCoordinate(const LatLng& p);

BoundingBox BoundsOf(const std::vector<LatLng>& points);
BoundingBox BoundsOf(const MultiPolygon& geometry);

// Ray casting. Points on a hole boundary count as outside the hole.
bool RingContains(const Ring& ring, const LatLng& p);
bool PolygonContains(const Polygon& polygon, const LatLng& p);
bool MultiPolygonContains(const MultiPolygon& geometry, const LatLng& p);

// Closed-segment intersection, collinear overlap included.
bool SegmentsIntersect(const LatLng& a1, const LatLng& a2, const LatLng& b1, const LatLng& b2);

// True if segment a-b touches the polygon: either endpoint inside, or the
// segment crosses any ring edge.
bool SegmentTouchesPolygon(const LatLng& a, const LatLng& b, const Polygon& polygon);

// Great-circle helpers (WGS84 mean radius).
double HaversineMeters(const LatLng& a, const LatLng& b);
double InitialBearingDeg(const LatLng& from, const LatLng& to);
double BearingDifferenceDeg(double a, double b);

// Approximates a circle of radius_m around center as a closed ring.
Polygon BufferPoint(const LatLng& center, double radius_m, int segments = 16);

/*
  Direction names ("northbound", "NB", "north", "eastbound", ...) mapped to a
  compass bearing. any_direction is set for "both"/"all" style values.
*/
struct Direction {
  bool                  any_direction = false;
  std::optional<double> bearing_deg;
};

std::optional<Direction> ParseDirection(std::string_view name);

} // namespace impact::geo
