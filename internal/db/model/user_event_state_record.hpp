#pragma once

#include <cstdint>
#include <string>

namespace impact::db::model {

/*
  Delivery state of one event for one user. Primary key (user_id, event_id).

  event_expires_ms is copied from the event so expired rows can be purged
  without a join.
*/
struct UserEventStateRecord {
  std::string user_id;
  std::string event_id;

  uint64_t delivered_at_ms = 0;
  bool     read            = false;
  uint64_t read_at_ms      = 0;

  uint64_t event_expires_ms = 0;
};

} // namespace impact::db::model
