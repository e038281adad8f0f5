#include "pg_pool.hpp"

namespace impact::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_event", std::string("SELECT ") + kEventSelectColumns + " FROM events WHERE id=$1");

  conn.prepare("upsert_event",
               "INSERT INTO events(id,source_type,geometry_json,min_lon,min_lat,max_lon,max_lat,start_ms,expires_ms,"
               "severity,certainty,urgency,description,headline,directionality,reroute_hint,raw_metadata_json,version,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17::jsonb,$18,$19) "
               "ON CONFLICT(id) DO UPDATE SET source_type=EXCLUDED.source_type,geometry_json=EXCLUDED.geometry_json,"
               "min_lon=EXCLUDED.min_lon,min_lat=EXCLUDED.min_lat,max_lon=EXCLUDED.max_lon,max_lat=EXCLUDED.max_lat,"
               "start_ms=EXCLUDED.start_ms,expires_ms=EXCLUDED.expires_ms,severity=EXCLUDED.severity,"
               "certainty=EXCLUDED.certainty,urgency=EXCLUDED.urgency,description=EXCLUDED.description,"
               "headline=EXCLUDED.headline,directionality=EXCLUDED.directionality,reroute_hint=EXCLUDED.reroute_hint,"
               "raw_metadata_json=EXCLUDED.raw_metadata_json,version=EXCLUDED.version,updated_at_ms=EXCLUDED.updated_at_ms");

  conn.prepare("max_event_version", "SELECT COALESCE(MAX(version),0) FROM events");

  conn.prepare("insert_user_event_state_if_absent",
               "INSERT INTO user_event_state(user_id,event_id,delivered_at_ms,read,read_at_ms,event_expires_ms) "
               "VALUES($1,$2,$3,$4,$5,$6) ON CONFLICT(user_id,event_id) DO NOTHING");

  conn.prepare("get_user_event_state",
               "SELECT user_id,event_id,delivered_at_ms,read,read_at_ms,event_expires_ms "
               "FROM user_event_state WHERE user_id=$1 AND event_id=$2");

  conn.prepare("mark_user_event_state_read",
               "UPDATE user_event_state SET read_at_ms=CASE WHEN read THEN read_at_ms ELSE $3 END, read=TRUE "
               "WHERE user_id=$1 AND event_id=$2");

  conn.prepare("delete_expired_user_event_states", "DELETE FROM user_event_state WHERE event_expires_ms < $1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace impact::db::postgres
