#include "event_mapper.hpp"

#include "internal/util/time.hpp"

namespace impact::store {

model::Event ToDomain(const db::model::EventRecord& r) {
  model::Event e;
  e.id          = r.id;
  e.source_type = static_cast<model::SourceType>(r.source_type);
  e.geometry    = geo::ParseGeoJson(r.geometry_json);
  e.bbox        = {r.min_lon, r.min_lat, r.max_lon, r.max_lat};
  e.start       = util::FromUnixMillis(r.start_ms);
  e.expires     = util::FromUnixMillis(r.expires_ms);

  e.severity    = r.severity;
  e.certainty   = r.certainty;
  e.urgency     = r.urgency;
  e.description = r.description;
  e.headline    = r.headline;
  if (!r.directionality.empty()) {
    e.directionality = r.directionality;
  }

  e.version           = r.version;
  e.reroute_hint      = r.reroute_hint;
  e.raw_metadata_json = r.raw_metadata_json.empty() ? "{}" : r.raw_metadata_json;
  return e;
}

db::model::EventRecord ToRecord(const model::Event& e) {
  db::model::EventRecord r;
  r.id            = e.id;
  r.source_type   = static_cast<int>(e.source_type);
  r.geometry_json = geo::ToGeoJson(e.geometry);
  r.min_lon       = e.bbox.min_lon;
  r.min_lat       = e.bbox.min_lat;
  r.max_lon       = e.bbox.max_lon;
  r.max_lat       = e.bbox.max_lat;
  r.start_ms      = util::ToUnixMillis(e.start);
  r.expires_ms    = util::ToUnixMillis(e.expires);

  r.severity       = e.severity;
  r.certainty      = e.certainty;
  r.urgency        = e.urgency;
  r.description    = e.description;
  r.headline       = e.headline;
  r.directionality = e.directionality.value_or("");

  r.reroute_hint      = e.reroute_hint;
  r.raw_metadata_json = e.raw_metadata_json;
  r.version           = e.version;
  return r;
}

} // namespace impact::store
