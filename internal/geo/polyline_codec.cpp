#include "polyline_codec.hpp"

#include <array>
#include <cmath>
#include <cstdint>
#include <utility>

namespace impact::geo {

namespace {

constexpr int kMaxPrecision = 10;

constexpr std::string_view kHereAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr std::array<int8_t, 128> BuildHereTable() {
  std::array<int8_t, 128> table{};
  for (auto& v : table) v = -1;
  for (std::size_t i = 0; i < kHereAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kHereAlphabet[i])] = static_cast<int8_t>(i);
  }
  return table;
}

constexpr auto kHereTable = BuildHereTable();

int64_t ZigZagDecode(uint64_t value) {
  return (value & 1) ? ~static_cast<int64_t>(value >> 1) : static_cast<int64_t>(value >> 1);
}

// Adds one decoded delta to a running coordinate. The running value is
// always a valid coordinate, so a delta within one full turn cannot overflow.
bool ApplyDelta(int64_t& value, uint64_t raw, double scale) {
  const int64_t delta = ZigZagDecode(raw);
  if (std::fabs(static_cast<double>(delta)) > 360.0 * scale) {
    return false;
  }
  value += delta;
  return true;
}

double Pow10(int precision) {
  return std::pow(10.0, precision);
}

DecodeResult Fail(DecodeErrorKind kind, std::size_t position, std::string message) {
  DecodeResult result;
  result.error = DecodeError{kind, position, std::move(message)};
  return result;
}

/*
  Reads one varint. Each symbol carries 5 value bits; 0x20 marks a
  continuation. Returns false if the input ends in the middle of a value.
*/
template <typename SymbolFn>
bool ReadVarint(std::string_view in, std::size_t& pos, SymbolFn symbol, uint64_t& out) {
  uint64_t result = 0;
  int      shift  = 0;
  while (pos < in.size()) {
    const int chunk = symbol(in[pos]);
    ++pos;
    if (shift < 64) {
      result |= static_cast<uint64_t>(chunk & 0x1f) << shift;
    }
    shift += 5;
    if (chunk < 0x20) {
      out = result;
      return true;
    }
  }
  return false;
}

} // namespace

std::string_view ToString(DecodeErrorKind kind) {
  switch (kind) {
    case DecodeErrorKind::kTooLong:
      return "too_long";
    case DecodeErrorKind::kInvalidCharacter:
      return "invalid_character";
    case DecodeErrorKind::kTruncated:
      return "truncated";
    case DecodeErrorKind::kUnsupportedHeader:
      return "unsupported_header";
    case DecodeErrorKind::kCoordinateOutOfRange:
      return "coordinate_out_of_range";
  }
  return "unknown";
}

PolylineCodec::PolylineCodec(PolylineOptions options) : options_(options) {
  if (options_.google_precision <= 0 || options_.google_precision > kMaxPrecision) {
    options_.google_precision = 5;
  }
}

DecodeResult PolylineCodec::Decode(std::string_view encoded, PolylineFormat format) const {
  if (encoded.size() > options_.max_length) {
    return Fail(DecodeErrorKind::kTooLong, options_.max_length,
                "polyline length " + std::to_string(encoded.size()) + " exceeds limit " + std::to_string(options_.max_length));
  }
  return format == PolylineFormat::kHere ? DecodeHere(encoded) : DecodeGoogle(encoded);
}

DecodeResult PolylineCodec::DecodeGoogle(std::string_view encoded) const {
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    const auto c = static_cast<unsigned char>(encoded[i]);
    if (c < 63 || c > 126) {
      return Fail(DecodeErrorKind::kInvalidCharacter, i, "invalid character in google polyline");
    }
  }

  const double  scale = Pow10(options_.google_precision);
  const auto    symbol = [](char c) { return static_cast<int>(static_cast<unsigned char>(c)) - 63; };
  DecodeResult  result;
  std::size_t   pos = 0;
  int64_t       lat = 0;
  int64_t       lon = 0;

  while (pos < encoded.size()) {
    const std::size_t start = pos;
    uint64_t          dlat  = 0;
    uint64_t          dlon  = 0;
    if (!ReadVarint(encoded, pos, symbol, dlat)) {
      return Fail(DecodeErrorKind::kTruncated, start, "polyline ends inside a latitude value");
    }
    if (pos >= encoded.size() || !ReadVarint(encoded, pos, symbol, dlon)) {
      return Fail(DecodeErrorKind::kTruncated, pos, "polyline ends before a longitude value");
    }

    if (!ApplyDelta(lat, dlat, scale) || !ApplyDelta(lon, dlon, scale)) {
      return Fail(DecodeErrorKind::kCoordinateOutOfRange, start, "coordinate delta out of range");
    }

    LatLng p{static_cast<double>(lat) / scale, static_cast<double>(lon) / scale};
    if (!IsValidCoordinate(p)) {
      return Fail(DecodeErrorKind::kCoordinateOutOfRange, start, "decoded coordinate out of range");
    }
    result.coordinates.push_back(p);
  }
  return result;
}

DecodeResult PolylineCodec::DecodeHere(std::string_view encoded) const {
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    const auto c = static_cast<unsigned char>(encoded[i]);
    if (c >= kHereTable.size() || kHereTable[c] < 0) {
      return Fail(DecodeErrorKind::kInvalidCharacter, i, "invalid character in flexible polyline");
    }
  }
  if (encoded.empty()) {
    return {};
  }

  const auto  symbol = [](char c) { return static_cast<int>(kHereTable[static_cast<unsigned char>(c)]); };
  std::size_t pos    = 0;

  uint64_t version = 0;
  if (!ReadVarint(encoded, pos, symbol, version)) {
    return Fail(DecodeErrorKind::kTruncated, 0, "flexible polyline header is truncated");
  }
  if (version != 1) {
    return Fail(DecodeErrorKind::kUnsupportedHeader, 0, "unsupported flexible polyline version " + std::to_string(version));
  }

  uint64_t header = 0;
  if (!ReadVarint(encoded, pos, symbol, header)) {
    return Fail(DecodeErrorKind::kTruncated, pos, "flexible polyline header is truncated");
  }
  const int precision = static_cast<int>(header & 15);
  const int third_dim = static_cast<int>((header >> 4) & 7);
  if (third_dim == 4 || third_dim == 5) {
    // 4 and 5 are reserved by the format.
    return Fail(DecodeErrorKind::kUnsupportedHeader, pos, "reserved third dimension type " + std::to_string(third_dim));
  }
  const int dimensions = third_dim == 0 ? 2 : 3;

  const double scale = Pow10(precision);
  DecodeResult result;
  int64_t      lat = 0;
  int64_t      lon = 0;

  while (pos < encoded.size()) {
    const std::size_t start = pos;
    std::array<uint64_t, 3> raw{};
    for (int d = 0; d < dimensions; ++d) {
      if (pos >= encoded.size() || !ReadVarint(encoded, pos, symbol, raw[d])) {
        return Fail(DecodeErrorKind::kTruncated, start, "flexible polyline ends inside a coordinate");
      }
    }

    if (!ApplyDelta(lat, raw[0], scale) || !ApplyDelta(lon, raw[1], scale)) {
      return Fail(DecodeErrorKind::kCoordinateOutOfRange, start, "coordinate delta out of range");
    }
    // raw[2] carries the third dimension (altitude, elevation, ...), which routes do not use.

    LatLng p{static_cast<double>(lat) / scale, static_cast<double>(lon) / scale};
    if (!IsValidCoordinate(p)) {
      return Fail(DecodeErrorKind::kCoordinateOutOfRange, start, "decoded coordinate out of range");
    }
    result.coordinates.push_back(p);
  }
  return result;
}

std::string PolylineCodec::Encode(const std::vector<LatLng>& coordinates) const {
  const double scale = Pow10(options_.google_precision);

  std::string out;
  const auto  append = [&out](int64_t delta) {
    uint64_t value = delta < 0 ? ~(static_cast<uint64_t>(delta) << 1) : static_cast<uint64_t>(delta) << 1;
    while (value >= 0x20) {
      out.push_back(static_cast<char>((0x20 | (value & 0x1f)) + 63));
      value >>= 5;
    }
    out.push_back(static_cast<char>(value + 63));
  };

  int64_t prev_lat = 0;
  int64_t prev_lon = 0;
  for (const auto& p : coordinates) {
    const auto lat = static_cast<int64_t>(std::llround(p.lat * scale));
    const auto lon = static_cast<int64_t>(std::llround(p.lon * scale));
    append(lat - prev_lat);
    append(lon - prev_lon);
    prev_lat = lat;
    prev_lon = lon;
  }
  return out;
}

} // namespace impact::geo
