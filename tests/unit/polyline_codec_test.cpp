#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "internal/geo/polyline_codec.hpp"

namespace {

using impact::geo::DecodeErrorKind;
using impact::geo::LatLng;
using impact::geo::PolylineCodec;
using impact::geo::PolylineFormat;
using impact::geo::PolylineOptions;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

void ExpectPoints(const std::vector<LatLng>& got, const std::vector<LatLng>& want, double eps = 1e-9) {
  assert(got.size() == want.size());
  for (std::size_t i = 0; i < got.size(); ++i) {
    assert(Near(got[i].lat, want[i].lat, eps));
    assert(Near(got[i].lon, want[i].lon, eps));
  }
}

const std::vector<LatLng> kHoustonRoute = {{29.5, -95.5}, {29.6, -95.4}, {29.7, -95.3}};

void TestDecodesGoogleReferencePolyline() {
  PolylineCodec codec;
  auto          decoded = codec.Decode("_p~iF~ps|U_ulLnnqC_mqNvxq`@", PolylineFormat::kGoogle);
  assert(decoded);
  ExpectPoints(decoded.coordinates, {{38.5, -120.2}, {40.7, -120.95}, {43.252, -126.453}});
}

void TestEncodeMatchesDecode() {
  PolylineCodec codec;
  const auto    encoded = codec.Encode(kHoustonRoute);
  assert(encoded == "_v`sD~i{eQ_pR_pR_pR_pR");

  auto decoded = codec.Decode(encoded, PolylineFormat::kGoogle);
  assert(decoded);
  ExpectPoints(decoded.coordinates, kHoustonRoute);
}

void TestGooglePrecisionSix() {
  PolylineOptions options;
  options.google_precision = 6;
  PolylineCodec codec(options);

  auto decoded = codec.Decode("_epgw@~lzcuD_ibE_ibE_ibE_ibE", PolylineFormat::kGoogle);
  assert(decoded);
  ExpectPoints(decoded.coordinates, kHoustonRoute);
}

void TestDecodesHereTwoDimensional() {
  PolylineCodec codec;
  auto          decoded = codec.Decode("BFg3h0F_q8mSgxTgxTgxTgxT", PolylineFormat::kHere);
  assert(decoded);
  ExpectPoints(decoded.coordinates, kHoustonRoute);
}

void TestHereThirdDimensionIsDropped() {
  PolylineCodec codec;
  auto          decoded = codec.Decode("BlBoz5xJ67i1BU1B7PUzIhaU", PolylineFormat::kHere);
  assert(decoded);
  ExpectPoints(decoded.coordinates, {{50.10228, 8.69821}, {50.10201, 8.69567}, {50.10063, 8.6915}});
}

void TestInvalidInputReturnsErrorWithoutThrowing() {
  PolylineCodec codec;
  auto          decoded = codec.Decode("!!!invalid!!!", PolylineFormat::kGoogle);
  assert(!decoded);
  assert(decoded.coordinates.empty());
  assert(decoded.error->kind == DecodeErrorKind::kInvalidCharacter);
  assert(decoded.error->position == 0);
  assert(impact::geo::ToString(decoded.error->kind) == "invalid_character");
}

void TestTruncatedInput() {
  PolylineCodec codec;
  // Continuation bit set on the last character.
  auto decoded = codec.Decode("_p~iF~ps|U_", PolylineFormat::kGoogle);
  assert(!decoded);
  assert(decoded.coordinates.empty());
  assert(decoded.error->kind == DecodeErrorKind::kTruncated);
}

void TestLengthLimit() {
  PolylineOptions options;
  options.max_length = 8;
  PolylineCodec codec(options);

  auto decoded = codec.Decode("_p~iF~ps|U_ulLnnqC", PolylineFormat::kGoogle);
  assert(!decoded);
  assert(decoded.error->kind == DecodeErrorKind::kTooLong);
}

void TestHereRejectsUnknownVersion() {
  PolylineCodec codec;
  // Header version 2.
  auto decoded = codec.Decode("CFg3h0F_q8mS", PolylineFormat::kHere);
  assert(!decoded);
  assert(decoded.error->kind == DecodeErrorKind::kUnsupportedHeader);
}

void TestHugeDeltaIsRejected() {
  PolylineCodec codec;

  // (0.00001, 0.00001), then a latitude delta of INT64_MAX.
  auto google = codec.Decode("AA}~~~~~~~~~~~NA", PolylineFormat::kGoogle);
  assert(!google);
  assert(google.coordinates.empty());
  assert(google.error->kind == DecodeErrorKind::kCoordinateOutOfRange);
  assert(google.error->position == 2);

  // Same shape in flexible polyline form, precision 5.
  auto here = codec.Decode("BFCC-___________PC", PolylineFormat::kHere);
  assert(!here);
  assert(here.error->kind == DecodeErrorKind::kCoordinateOutOfRange);
  assert(here.error->position == 4);
}

void TestEmptyInputIsEmptyRoute() {
  PolylineCodec codec;
  auto          decoded = codec.Decode("", PolylineFormat::kGoogle);
  assert(decoded);
  assert(decoded.coordinates.empty());
}

void TestDecodingIsDeterministic() {
  PolylineCodec codec;
  auto          first  = codec.Decode("_p~iF~ps|U_ulLnnqC_mqNvxq`@", PolylineFormat::kGoogle);
  auto          second = codec.Decode("_p~iF~ps|U_ulLnnqC_mqNvxq`@", PolylineFormat::kGoogle);
  assert(first.coordinates.size() == second.coordinates.size());
  for (std::size_t i = 0; i < first.coordinates.size(); ++i) {
    assert(first.coordinates[i] == second.coordinates[i]);
  }
}

} // namespace

int main() {
  TestDecodesGoogleReferencePolyline();
  TestEncodeMatchesDecode();
  TestGooglePrecisionSix();
  TestDecodesHereTwoDimensional();
  TestHereThirdDimensionIsDropped();
  TestInvalidInputReturnsErrorWithoutThrowing();
  TestTruncatedInput();
  TestLengthLimit();
  TestHereRejectsUnknownVersion();
  TestHugeDeltaIsRejected();
  TestEmptyInputIsEmptyRoute();
  TestDecodingIsDeterministic();

  std::cout << "impact_engine_unit_polyline_codec: pass\n";
  return 0;
}
