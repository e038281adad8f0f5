#include "pg_repository.hpp"

#include <algorithm>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace impact::db::postgres {

namespace {

// Serializes version assignment across concurrent upserts.
constexpr long long kEventVersionLockKey = 0x696d70616374; // "impact"

model::EventRecord ReadEvent(const pqxx::row& row) {
  model::EventRecord r;
  r.id                = row[0].c_str();
  r.source_type       = row[1].as<int>();
  r.geometry_json     = row[2].c_str();
  r.min_lon           = row[3].as<double>();
  r.min_lat           = row[4].as<double>();
  r.max_lon           = row[5].as<double>();
  r.max_lat           = row[6].as<double>();
  r.start_ms          = row[7].as<uint64_t>();
  r.expires_ms        = row[8].as<uint64_t>();
  r.severity          = row[9].is_null() ? "" : row[9].c_str();
  r.certainty         = row[10].is_null() ? "" : row[10].c_str();
  r.urgency           = row[11].is_null() ? "" : row[11].c_str();
  r.description       = row[12].is_null() ? "" : row[12].c_str();
  r.headline          = row[13].is_null() ? "" : row[13].c_str();
  r.directionality    = row[14].is_null() ? "" : row[14].c_str();
  r.reroute_hint      = row[15].as<bool>();
  r.raw_metadata_json = row[16].c_str();
  r.version           = row[17].as<uint64_t>();
  r.updated_at_ms     = row[18].as<uint64_t>();
  return r;
}

model::UserEventStateRecord ReadUserEventState(const pqxx::row& row) {
  model::UserEventStateRecord r;
  r.user_id          = row[0].c_str();
  r.event_id         = row[1].c_str();
  r.delivered_at_ms  = row[2].as<uint64_t>();
  r.read             = row[3].as<bool>();
  r.read_at_ms       = row[4].as<uint64_t>();
  r.event_expires_ms = row[5].as<uint64_t>();
  return r;
}

std::vector<model::EventRecord> ReadEvents(const pqxx::result& res) {
  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadEvent(row));
  }
  return out;
}

std::string SelectEvents() {
  return std::string("SELECT ") + kEventSelectColumns + " FROM events";
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::UpsertEvent(Transaction& t, model::EventRecord& r) {
  try {
    auto& work = TX(t).Work();
    work.exec_params("SELECT pg_advisory_xact_lock($1);", kEventVersionLockKey);

    const uint64_t version = std::max(r.updated_at_ms, MaxEventVersion(t) + 1);
    const auto&    raw     = r.raw_metadata_json.empty() ? std::string("{}") : r.raw_metadata_json;

    work.exec_prepared("upsert_event", r.id, r.source_type, r.geometry_json, r.min_lon, r.min_lat, r.max_lon, r.max_lat, r.start_ms,
                       r.expires_ms, r.severity, r.certainty, r.urgency, r.description, r.headline, r.directionality, r.reroute_hint, raw,
                       version, r.updated_at_ms);
    r.version = version;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EventRecord> PgRepository::GetEvent(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_event", id);
  if (res.empty()) return std::nullopt;
  return ReadEvent(res[0]);
}

std::vector<model::EventRecord> PgRepository::QueryEventsByBoundingBox(Transaction& t, const EventBoxQuery& q) {
  const std::string query = SelectEvents() +
                            " WHERE max_lon >= $1 AND min_lon <= $2 AND max_lat >= $3 AND min_lat <= $4"
                            " AND start_ms <= $5 AND expires_ms >= $6" +
                            sql::SourceTypeFilter(q.source_types) + " ORDER BY version ASC;";
  auto res = TX(t).Work().exec_params(query, q.min_lon, q.max_lon, q.min_lat, q.max_lat, q.window_end_ms, q.window_start_ms);
  return ReadEvents(res);
}

std::vector<model::EventRecord> PgRepository::QueryEventsByVersion(Transaction& t, uint64_t since_version, std::optional<uint64_t> limit,
                                                                   const std::vector<int>& source_types) {
  std::string query = SelectEvents() + " WHERE version > $1" + sql::SourceTypeFilter(source_types) + " ORDER BY version ASC";
  if (limit) {
    query += " LIMIT " + std::to_string(*limit);
  }
  query += ";";

  auto res = TX(t).Work().exec_params(query, since_version);
  return ReadEvents(res);
}

uint64_t PgRepository::MaxEventVersion(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("max_event_version");
  return res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// User event state
// ------------------------------------------------------------------

Result PgRepository::InsertUserEventStateIfAbsent(Transaction& t, const model::UserEventStateRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_user_event_state_if_absent", r.user_id, r.event_id, r.delivered_at_ms, r.read, r.read_at_ms,
                                          r.event_expires_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UserEventStateRecord> PgRepository::GetUserEventState(Transaction& t, const std::string& user_id,
                                                                            const std::string& event_id) {
  auto res = TX(t).Work().exec_prepared("get_user_event_state", user_id, event_id);
  if (res.empty()) return std::nullopt;
  return ReadUserEventState(res[0]);
}

std::vector<model::UserEventStateRecord> PgRepository::ListUserEventStates(Transaction& t, const std::string& user_id, bool unread_only) {
  std::string query =
      "SELECT user_id,event_id,delivered_at_ms,read,read_at_ms,event_expires_ms FROM user_event_state WHERE user_id=$1";
  if (unread_only) {
    query += " AND NOT read";
  }
  query += " ORDER BY delivered_at_ms ASC, event_id ASC;";

  auto res = TX(t).Work().exec_params(query, user_id);

  std::vector<model::UserEventStateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadUserEventState(row));
  }
  return out;
}

Result PgRepository::MarkUserEventStateRead(Transaction& t, const std::string& user_id, const std::string& event_id, uint64_t read_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("mark_user_event_state_read", user_id, event_id, read_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteExpiredUserEventStates(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  deleted = 0;
  try {
    auto res = TX(t).Work().exec_prepared("delete_expired_user_event_states", now_ms);
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace impact::db::postgres
