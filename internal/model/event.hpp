#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/geo/geometry.hpp"

namespace impact::model {

enum class SourceType : std::uint8_t {
  kUnspecified  = 0,
  kIncident     = 1,
  kDms          = 2,
  kFlood        = 3,
  kClosure      = 4,
  kWeatherAlert = 5,
};

constexpr std::string_view ToString(SourceType type) {
  switch (type) {
    case SourceType::kIncident:
      return "incident";
    case SourceType::kDms:
      return "dms";
    case SourceType::kFlood:
      return "flood";
    case SourceType::kClosure:
      return "closure";
    case SourceType::kWeatherAlert:
      return "weather_alert";
    case SourceType::kUnspecified:
      break;
  }
  return "unspecified";
}

/*
  Normalized hazard event.

  Geometry is always polygonal; point events were buffered at ingestion.
  bbox is derived from geometry and used for coarse filtering only.
*/
struct Event {
  std::string id;
  SourceType  source_type = SourceType::kUnspecified;

  geo::MultiPolygon geometry;
  geo::BoundingBox  bbox;

  std::chrono::system_clock::time_point start{};
  std::chrono::system_clock::time_point expires{};

  std::string severity;
  std::string certainty;
  std::string urgency;
  std::string description;
  std::string headline;

  std::optional<std::string> directionality;

  std::uint64_t version      = 0;
  bool          reroute_hint = false;

  // Provider-specific fields, JSON object text.
  std::string raw_metadata_json = "{}";

  bool IsActiveAt(std::chrono::system_clock::time_point t) const {
    return start <= t && t <= expires;
  }

  bool IsExpiredAt(std::chrono::system_clock::time_point t) const {
    return t > expires;
  }
};

} // namespace impact::model
