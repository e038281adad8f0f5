#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/geo/geometry.hpp"
#include "internal/model/event.hpp"
#include "internal/store/event_mapper.hpp"
#include "internal/util/time.hpp"

/*
  Shared fixtures for engine tests. 2024-01-01 is the reference day; the
  Houston route and polygon are the standard impact scenario.
*/
namespace impact::testing {

inline util::TimePoint At(int hour, int minute = 0) {
  constexpr uint64_t kDayStartMs = 1704067200000ULL; // 2024-01-01T00:00:00Z
  return util::FromUnixMillis(kDayStartMs + (static_cast<uint64_t>(hour) * 60 + static_cast<uint64_t>(minute)) * 60 * 1000);
}

inline geo::Ring Square(double min_lat, double min_lon, double max_lat, double max_lon) {
  return {{min_lat, min_lon}, {min_lat, max_lon}, {max_lat, max_lon}, {max_lat, min_lon}, {min_lat, min_lon}};
}

inline const std::vector<geo::LatLng>& HoustonRoute() {
  static const std::vector<geo::LatLng> kRoute = {{29.5, -95.5}, {29.6, -95.4}, {29.7, -95.3}};
  return kRoute;
}

// Google p5 encoding of HoustonRoute().
inline constexpr const char* kHoustonPolyline = "_v`sD~i{eQ_pR_pR_pR_pR";

inline model::Event MakeEvent(const std::string& id, const geo::Ring& outer, util::TimePoint start, util::TimePoint expires,
                              model::SourceType type = model::SourceType::kIncident) {
  model::Event event;
  event.id          = id;
  event.source_type = type;
  event.geometry    = {geo::Polygon{outer, {}}};
  event.bbox        = geo::BoundsOf(event.geometry);
  event.start       = start;
  event.expires     = expires;
  event.severity    = "moderate";
  event.headline    = "incident " + id;
  return event;
}

inline model::Event ScenarioEvent(const std::string& id, util::TimePoint start, util::TimePoint expires) {
  return MakeEvent(id, Square(29.55, -95.55, 29.65, -95.35), start, expires);
}

inline std::shared_ptr<const model::Event> Share(model::Event event) {
  return std::make_shared<const model::Event>(std::move(event));
}

// Writes events through the repository; returns the assigned versions.
inline std::vector<uint64_t> Store(db::Repository& repository, const std::vector<model::Event>& events, uint64_t updated_at_ms = 0) {
  std::vector<uint64_t> versions;
  auto                  tx = repository.Begin();
  for (const auto& event : events) {
    auto record          = store::ToRecord(event);
    record.updated_at_ms = updated_at_ms;
    auto result          = repository.UpsertEvent(*tx, record);
    if (!result) {
      throw std::runtime_error("upsert failed: " + result.message);
    }
    versions.push_back(record.version);
  }
  tx->Commit();
  return versions;
}

} // namespace impact::testing
