#pragma once

#include <cstdint>
#include <vector>

namespace impact::db {

/*
  Coarse event lookup: bbox overlap plus validity window overlap.

  An event matches when its stored bbox intersects the query box and
  start_ms <= window_end_ms && expires_ms >= window_start_ms.
*/
struct EventBoxQuery {
  double min_lon = 0.0;
  double min_lat = 0.0;
  double max_lon = 0.0;
  double max_lat = 0.0;

  uint64_t window_start_ms = 0;
  uint64_t window_end_ms   = 0;

  // Empty = all source types.
  std::vector<int> source_types;
};

} // namespace impact::db
