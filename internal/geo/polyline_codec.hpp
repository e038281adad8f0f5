#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/geo/geometry.hpp"

namespace impact::geo {

enum class PolylineFormat { kGoogle, kHere };

enum class DecodeErrorKind {
  kTooLong,
  kInvalidCharacter,
  kTruncated,
  kUnsupportedHeader,
  kCoordinateOutOfRange,
};

std::string_view ToString(DecodeErrorKind kind);

struct DecodeError {
  DecodeErrorKind kind     = DecodeErrorKind::kInvalidCharacter;
  std::size_t     position = 0; // byte offset into the encoded string
  std::string     message;
};

struct DecodeResult {
  std::vector<LatLng>        coordinates;
  std::optional<DecodeError> error;

  explicit operator bool() const {
    return !error.has_value();
  }
};

struct PolylineOptions {
  std::size_t max_length       = 100000;
  int         google_precision = 5;
};

/*
  Google encoded polyline and HERE flexible polyline decoder.

  Decode never throws on malformed input: the error is returned with the
  offending position and coordinates are left empty. Stateless; one
  instance can be shared by all request threads.
*/
class PolylineCodec {
 public:
  explicit PolylineCodec(PolylineOptions options = {});

  DecodeResult Decode(std::string_view encoded, PolylineFormat format) const;

  // Google format at the configured precision.
  std::string Encode(const std::vector<LatLng>& coordinates) const;

  const PolylineOptions& options() const {
    return options_;
  }

 private:
  DecodeResult DecodeGoogle(std::string_view encoded) const;
  DecodeResult DecodeHere(std::string_view encoded) const;

  PolylineOptions options_;
};

} // namespace impact::geo
