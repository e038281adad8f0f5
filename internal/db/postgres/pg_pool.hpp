#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace impact::db::postgres {

// raw_metadata_json is JSONB; read it back as text.
inline constexpr const char* kEventSelectColumns =
    "id,source_type,geometry_json,min_lon,min_lat,max_lon,max_lat,start_ms,expires_ms,severity,certainty,urgency,"
    "description,headline,directionality,reroute_hint,raw_metadata_json::text,version,updated_at_ms";

/*
  Bounded connection pool for PgRepository.

  - A transaction owns one connection until it is destroyed; pqxx
    connections are not thread-safe and are never shared.
  - Prepared statements are installed once per connection.
  - Acquire() blocks when max_connections are in use.

  Connections hand themselves back through the shared_ptr deleter; if the
  pool is already gone they are closed instead.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a new ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace impact::db::postgres
