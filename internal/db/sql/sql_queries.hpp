#pragma once

#include <string>
#include <vector>

namespace impact::db::sql {

/*
  Canonical SQL used by the SQLite backend and the schema bootstrap.

  IMPORTANT:
  These are written in the SQL subset shared by SQLite and PostgreSQL.
  The PostgreSQL backend uses the same statements with $n placeholders.
*/

static constexpr const char* EVENT_COLUMNS =
    "id,source_type,geometry_json,min_lon,min_lat,max_lon,max_lat,start_ms,expires_ms,"
    "severity,certainty,urgency,description,headline,directionality,reroute_hint,"
    "raw_metadata_json,version,updated_at_ms";

static constexpr const char* UPSERT_EVENT =
    "INSERT INTO events(id,source_type,geometry_json,min_lon,min_lat,max_lon,max_lat,start_ms,expires_ms,"
    "severity,certainty,urgency,description,headline,directionality,reroute_hint,"
    "raw_metadata_json,version,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " source_type=excluded.source_type,"
    " geometry_json=excluded.geometry_json,"
    " min_lon=excluded.min_lon,"
    " min_lat=excluded.min_lat,"
    " max_lon=excluded.max_lon,"
    " max_lat=excluded.max_lat,"
    " start_ms=excluded.start_ms,"
    " expires_ms=excluded.expires_ms,"
    " severity=excluded.severity,"
    " certainty=excluded.certainty,"
    " urgency=excluded.urgency,"
    " description=excluded.description,"
    " headline=excluded.headline,"
    " directionality=excluded.directionality,"
    " reroute_hint=excluded.reroute_hint,"
    " raw_metadata_json=excluded.raw_metadata_json,"
    " version=excluded.version,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* MAX_EVENT_VERSION =
    "SELECT COALESCE(MAX(version),0) FROM events;";

// user event state

static constexpr const char* INSERT_USER_EVENT_STATE_IF_ABSENT =
    "INSERT INTO user_event_state(user_id,event_id,delivered_at_ms,read,read_at_ms,event_expires_ms)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(user_id,event_id) DO NOTHING;";

static constexpr const char* SELECT_USER_EVENT_STATE =
    "SELECT user_id,event_id,delivered_at_ms,read,read_at_ms,event_expires_ms"
    " FROM user_event_state WHERE user_id=? AND event_id=?;";

static constexpr const char* LIST_USER_EVENT_STATES =
    "SELECT user_id,event_id,delivered_at_ms,read,read_at_ms,event_expires_ms"
    " FROM user_event_state WHERE user_id=?";

static constexpr const char* LIST_USER_EVENT_STATES_ORDER =
    " ORDER BY delivered_at_ms ASC, event_id ASC;";

static constexpr const char* DELETE_EXPIRED_USER_EVENT_STATES =
    "DELETE FROM user_event_state WHERE event_expires_ms < ?;";

// schema

static const std::vector<std::string> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS events (id TEXT PRIMARY KEY, source_type INTEGER NOT NULL, geometry_json TEXT NOT NULL,"
    " min_lon REAL NOT NULL, min_lat REAL NOT NULL, max_lon REAL NOT NULL, max_lat REAL NOT NULL,"
    " start_ms INTEGER NOT NULL, expires_ms INTEGER NOT NULL, severity TEXT, certainty TEXT, urgency TEXT,"
    " description TEXT, headline TEXT, directionality TEXT, reroute_hint INTEGER NOT NULL DEFAULT 0,"
    " raw_metadata_json TEXT NOT NULL DEFAULT '{}', version INTEGER NOT NULL UNIQUE, updated_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS events_bbox_idx ON events(min_lon, max_lon, min_lat, max_lat);",
    "CREATE INDEX IF NOT EXISTS events_expires_idx ON events(expires_ms);",
    "CREATE TABLE IF NOT EXISTS user_event_state (user_id TEXT NOT NULL, event_id TEXT NOT NULL,"
    " delivered_at_ms INTEGER NOT NULL, read INTEGER NOT NULL DEFAULT 0, read_at_ms INTEGER NOT NULL DEFAULT 0,"
    " event_expires_ms INTEGER NOT NULL, PRIMARY KEY (user_id, event_id));",
    "CREATE INDEX IF NOT EXISTS user_event_state_expires_idx ON user_event_state(event_expires_ms);"};

static const std::vector<std::string> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS events (id TEXT PRIMARY KEY, source_type SMALLINT NOT NULL, geometry_json TEXT NOT NULL,"
    " min_lon DOUBLE PRECISION NOT NULL, min_lat DOUBLE PRECISION NOT NULL, max_lon DOUBLE PRECISION NOT NULL,"
    " max_lat DOUBLE PRECISION NOT NULL, start_ms BIGINT NOT NULL, expires_ms BIGINT NOT NULL, severity TEXT,"
    " certainty TEXT, urgency TEXT, description TEXT, headline TEXT, directionality TEXT,"
    " reroute_hint BOOLEAN NOT NULL DEFAULT FALSE, raw_metadata_json JSONB NOT NULL DEFAULT '{}'::jsonb,"
    " version BIGINT NOT NULL UNIQUE, updated_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS events_bbox_idx ON events(min_lon, max_lon, min_lat, max_lat);",
    "CREATE INDEX IF NOT EXISTS events_expires_idx ON events(expires_ms);",
    "CREATE TABLE IF NOT EXISTS user_event_state (user_id TEXT NOT NULL, event_id TEXT NOT NULL,"
    " delivered_at_ms BIGINT NOT NULL, read BOOLEAN NOT NULL DEFAULT FALSE, read_at_ms BIGINT NOT NULL DEFAULT 0,"
    " event_expires_ms BIGINT NOT NULL, PRIMARY KEY (user_id, event_id));",
    "CREATE INDEX IF NOT EXISTS user_event_state_expires_idx ON user_event_state(event_expires_ms);"};

// Integers only, so the list is inlined into the statement.
inline std::string SourceTypeFilter(const std::vector<int>& source_types) {
  if (source_types.empty()) {
    return {};
  }
  std::string out = " AND source_type IN (";
  for (size_t i = 0; i < source_types.size(); ++i) {
    if (i) out += ",";
    out += std::to_string(source_types[i]);
  }
  out += ")";
  return out;
}

} // namespace impact::db::sql
