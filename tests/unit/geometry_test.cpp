#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/geo/geometry.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace impact::geo;

Ring Square(double min_lat, double min_lon, double max_lat, double max_lon) {
  return {{min_lat, min_lon}, {min_lat, max_lon}, {max_lat, max_lon}, {max_lat, min_lon}, {min_lat, min_lon}};
}

void TestRingContainsUsesRayCasting() {
  const auto ring = Square(29.55, -95.55, 29.65, -95.35);
  assert(RingContains(ring, {29.6, -95.4}));
  assert(!RingContains(ring, {29.5, -95.5}));
  assert(!RingContains(ring, {29.7, -95.3}));

  // Concave "L" shape: the notch is outside.
  const Ring l_shape = {{0, 0}, {0, 4}, {1, 4}, {1, 1}, {4, 1}, {4, 0}, {0, 0}};
  assert(RingContains(l_shape, {0.5, 3.0}));
  assert(RingContains(l_shape, {3.0, 0.5}));
  assert(!RingContains(l_shape, {3.0, 3.0}));
}

void TestPolygonHolesAreExcluded() {
  Polygon polygon;
  polygon.outer = Square(0, 0, 10, 10);
  polygon.holes.push_back(Square(4, 4, 6, 6));

  assert(PolygonContains(polygon, {2, 2}));
  assert(!PolygonContains(polygon, {5, 5}));
  assert(!PolygonContains(polygon, {11, 5}));

  MultiPolygon multi{polygon, Polygon{Square(20, 20, 21, 21), {}}};
  assert(MultiPolygonContains(multi, {20.5, 20.5}));
  assert(!MultiPolygonContains(multi, {5, 5}));
}

void TestSegmentIntersection() {
  assert(SegmentsIntersect({0, 0}, {2, 2}, {0, 2}, {2, 0}));
  assert(!SegmentsIntersect({0, 0}, {1, 1}, {2, 2}, {3, 0}));
  // Collinear overlap.
  assert(SegmentsIntersect({0, 0}, {0, 2}, {0, 1}, {0, 3}));
}

void TestSegmentCrossingPolygonWithBothEndpointsOutside() {
  Polygon polygon;
  polygon.outer = Square(1, 1, 2, 2);

  // Passes straight through, no vertex inside.
  assert(SegmentTouchesPolygon({1.5, 0}, {1.5, 3}, polygon));
  assert(!SegmentTouchesPolygon({3, 0}, {3, 3}, polygon));
}

void TestHaversineAndBearing() {
  // One degree of latitude is ~111.2 km.
  const double d = HaversineMeters({0, 0}, {1, 0});
  assert(std::fabs(d - 111195.0) < 50.0);

  assert(std::fabs(InitialBearingDeg({0, 0}, {1, 0}) - 0.0) < 1e-6);
  assert(std::fabs(InitialBearingDeg({0, 0}, {0, 1}) - 90.0) < 1e-6);
  assert(std::fabs(InitialBearingDeg({0, 0}, {-1, 0}) - 180.0) < 1e-6);

  assert(std::fabs(BearingDifferenceDeg(350.0, 10.0) - 20.0) < 1e-9);
  assert(std::fabs(BearingDifferenceDeg(90.0, 270.0) - 180.0) < 1e-9);
}

void TestBoundingBoxValidation() {
  ValidateBoundingBox({-95.5, 29.5, -95.0, 30.0});

  const BoundingBox invalid[] = {
      {-95.0, 29.5, -95.5, 30.0},  // min_lon > max_lon
      {-95.5, 30.0, -95.0, 29.5},  // min_lat > max_lat
      {-95.5, -91.0, -95.0, 30.0}, // lat out of range
      {-181.0, 29.5, -95.0, 30.0}, // lon out of range
  };
  for (const auto& box : invalid) {
    bool threw = false;
    try {
      ValidateBoundingBox(box);
    } catch (const impact::util::ValidationError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestBoundingBoxOverlap() {
  const BoundingBox query{-95.5, 29.5, -95.0, 30.0};
  assert(query.Overlaps({-95.6, 29.4, -95.4, 29.6}));
  assert(!query.Overlaps({-94.1, 29.6, -93.9, 29.8}));
}

void TestBufferPointIsClosedAroundCenter() {
  const auto polygon = BufferPoint({29.6, -95.4}, 200.0);
  assert(polygon.outer.size() >= 4);
  assert(polygon.outer.front() == polygon.outer.back());
  assert(PolygonContains(polygon, {29.6, -95.4}));
  for (const auto& p : polygon.outer) {
    assert(std::fabs(HaversineMeters({29.6, -95.4}, p) - 200.0) < 5.0);
  }
}

void TestParseDirection() {
  assert(ParseDirection("Northbound")->bearing_deg == 0.0);
  assert(ParseDirection("NB")->bearing_deg == 0.0);
  assert(ParseDirection("east bound")->bearing_deg == 90.0);
  assert(ParseDirection("SB")->bearing_deg == 180.0);
  assert(ParseDirection("westbound")->bearing_deg == 270.0);
  assert(ParseDirection("north-east")->bearing_deg == 45.0);
  assert(ParseDirection("both")->any_direction);
  assert(ParseDirection("All Directions")->any_direction);
  assert(!ParseDirection("sideways").has_value());
}

} // namespace

int main() {
  TestRingContainsUsesRayCasting();
  TestPolygonHolesAreExcluded();
  TestSegmentIntersection();
  TestSegmentCrossingPolygonWithBothEndpointsOutside();
  TestHaversineAndBearing();
  TestBoundingBoxValidation();
  TestBoundingBoxOverlap();
  TestBufferPointIsClosedAroundCenter();
  TestParseDirection();

  std::cout << "impact_engine_unit_geometry: pass\n";
  return 0;
}
