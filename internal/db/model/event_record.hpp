#pragma once

#include <cstdint>
#include <string>

namespace impact::db::model {

/*
  Persistent event row.

  - id is the provider's stable identifier; re-ingesting it updates the row.
  - version is assigned by the repository on every upsert and is strictly
    greater than any version previously handed out.
  - min/max columns are the geometry bbox, used for coarse filtering.
*/
struct EventRecord {
  std::string id;
  int         source_type = 0;

  std::string geometry_json;
  double      min_lon = 0.0;
  double      min_lat = 0.0;
  double      max_lon = 0.0;
  double      max_lat = 0.0;

  uint64_t start_ms   = 0;
  uint64_t expires_ms = 0;

  std::string severity;
  std::string certainty;
  std::string urgency;
  std::string description;
  std::string headline;
  std::string directionality; // empty = none

  bool        reroute_hint = false;
  std::string raw_metadata_json;

  uint64_t version       = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace impact::db::model
