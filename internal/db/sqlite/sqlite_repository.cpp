#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_queries.hpp"

namespace impact::db::sqlite {

using impact::db::ErrorCode;
using impact::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord r;
  r.id                = ColText(st, 0);
  r.source_type       = ColI32(st, 1);
  r.geometry_json     = ColText(st, 2);
  r.min_lon           = ColDouble(st, 3);
  r.min_lat           = ColDouble(st, 4);
  r.max_lon           = ColDouble(st, 5);
  r.max_lat           = ColDouble(st, 6);
  r.start_ms          = ColU64(st, 7);
  r.expires_ms        = ColU64(st, 8);
  r.severity          = ColText(st, 9);
  r.certainty         = ColText(st, 10);
  r.urgency           = ColText(st, 11);
  r.description       = ColText(st, 12);
  r.headline          = ColText(st, 13);
  r.directionality    = ColText(st, 14);
  r.reroute_hint      = ColI32(st, 15) != 0;
  r.raw_metadata_json = ColText(st, 16);
  r.version           = ColU64(st, 17);
  r.updated_at_ms     = ColU64(st, 18);
  return r;
}

model::UserEventStateRecord ReadUserEventState(sqlite3_stmt* st) {
  model::UserEventStateRecord r;
  r.user_id          = ColText(st, 0);
  r.event_id         = ColText(st, 1);
  r.delivered_at_ms  = ColU64(st, 2);
  r.read             = ColI32(st, 3) != 0;
  r.read_at_ms       = ColU64(st, 4);
  r.event_expires_ms = ColU64(st, 5);
  return r;
}

std::vector<model::EventRecord> CollectEvents(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::EventRecord> out;
  int                             rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadEvent(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::UpsertEvent(Transaction& t, model::EventRecord& r) {
  auto* db = TX(t).Handle();

  uint64_t max_version = 0;
  try {
    max_version = MaxEventVersion(t);
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
  const uint64_t version = std::max(r.updated_at_ms, max_version + 1);

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPSERT_EVENT, -1, &st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr guard(st, &sqlite3_finalize);

  BindText(st, 1, r.id);
  BindI32(st, 2, r.source_type);
  BindText(st, 3, r.geometry_json);
  BindDouble(st, 4, r.min_lon);
  BindDouble(st, 5, r.min_lat);
  BindDouble(st, 6, r.max_lon);
  BindDouble(st, 7, r.max_lat);
  BindU64(st, 8, r.start_ms);
  BindU64(st, 9, r.expires_ms);
  BindText(st, 10, r.severity);
  BindText(st, 11, r.certainty);
  BindText(st, 12, r.urgency);
  BindText(st, 13, r.description);
  BindText(st, 14, r.headline);
  BindText(st, 15, r.directionality);
  BindI32(st, 16, r.reroute_hint ? 1 : 0);
  BindText(st, 17, r.raw_metadata_json);
  BindU64(st, 18, version);
  BindU64(st, 19, r.updated_at_ms);

  auto result = Translate(db, sqlite3_step(st));
  if (result) {
    r.version = version;
  }
  return result;
}

std::optional<model::EventRecord> SqliteRepository::GetEvent(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string("SELECT ") + sql::EVENT_COLUMNS + " FROM events WHERE id=?;");
  BindText(st.get(), 1, id);

  auto rows = CollectEvents(db, st.get());
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

std::vector<model::EventRecord> SqliteRepository::QueryEventsByBoundingBox(Transaction& t, const EventBoxQuery& q) {
  auto* db = TX(t).Handle();

  const std::string query = std::string("SELECT ") + sql::EVENT_COLUMNS +
                            " FROM events WHERE max_lon >= ? AND min_lon <= ? AND max_lat >= ? AND min_lat <= ?"
                            " AND start_ms <= ? AND expires_ms >= ?" +
                            sql::SourceTypeFilter(q.source_types) + " ORDER BY version ASC;";
  auto st = Prepare(db, query);
  BindDouble(st.get(), 1, q.min_lon);
  BindDouble(st.get(), 2, q.max_lon);
  BindDouble(st.get(), 3, q.min_lat);
  BindDouble(st.get(), 4, q.max_lat);
  BindU64(st.get(), 5, q.window_end_ms);
  BindU64(st.get(), 6, q.window_start_ms);

  return CollectEvents(db, st.get());
}

std::vector<model::EventRecord> SqliteRepository::QueryEventsByVersion(Transaction& t, uint64_t since_version, std::optional<uint64_t> limit,
                                                                       const std::vector<int>& source_types) {
  auto* db = TX(t).Handle();

  std::string query = std::string("SELECT ") + sql::EVENT_COLUMNS + " FROM events WHERE version > ?" + sql::SourceTypeFilter(source_types) +
                      " ORDER BY version ASC";
  if (limit) {
    query += " LIMIT ?";
  }
  query += ";";

  auto st = Prepare(db, query);
  BindU64(st.get(), 1, since_version);
  if (limit) {
    BindU64(st.get(), 2, *limit);
  }
  return CollectEvents(db, st.get());
}

uint64_t SqliteRepository::MaxEventVersion(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::MAX_EVENT_VERSION);

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// User event state
// ------------------------------------------------------------------

Result SqliteRepository::InsertUserEventStateIfAbsent(Transaction& t, const model::UserEventStateRecord& r) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::INSERT_USER_EVENT_STATE_IF_ABSENT, -1, &st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr guard(st, &sqlite3_finalize);

  BindText(st, 1, r.user_id);
  BindText(st, 2, r.event_id);
  BindU64(st, 3, r.delivered_at_ms);
  BindI32(st, 4, r.read ? 1 : 0);
  BindU64(st, 5, r.read_at_ms);
  BindU64(st, 6, r.event_expires_ms);

  auto result = Translate(db, sqlite3_step(st));
  if (!result) return result;

  // DO NOTHING leaves the change count at zero for an existing pair.
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::AlreadyExists);
  return Result::Ok();
}

std::optional<model::UserEventStateRecord> SqliteRepository::GetUserEventState(Transaction& t, const std::string& user_id,
                                                                                const std::string& event_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_USER_EVENT_STATE);
  BindText(st.get(), 1, user_id);
  BindText(st.get(), 2, event_id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return ReadUserEventState(st.get());
}

std::vector<model::UserEventStateRecord> SqliteRepository::ListUserEventStates(Transaction& t, const std::string& user_id, bool unread_only) {
  auto* db = TX(t).Handle();

  std::string query = sql::LIST_USER_EVENT_STATES;
  if (unread_only) {
    query += " AND read=0";
  }
  query += sql::LIST_USER_EVENT_STATES_ORDER;

  auto st = Prepare(db, query);
  BindText(st.get(), 1, user_id);

  std::vector<model::UserEventStateRecord> out;
  int                                      rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadUserEventState(st.get()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

Result SqliteRepository::MarkUserEventStateRead(Transaction& t, const std::string& user_id, const std::string& event_id, uint64_t read_at_ms) {
  auto* db = TX(t).Handle();

  const char* query =
      "UPDATE user_event_state SET read_at_ms=CASE WHEN read=1 THEN read_at_ms ELSE ? END, read=1"
      " WHERE user_id=? AND event_id=?;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, query, -1, &st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr guard(st, &sqlite3_finalize);

  BindU64(st, 1, read_at_ms);
  BindText(st, 2, user_id);
  BindText(st, 3, event_id);

  auto result = Translate(db, sqlite3_step(st));
  if (!result) return result;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::DeleteExpiredUserEventStates(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  auto* db = TX(t).Handle();
  deleted  = 0;

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::DELETE_EXPIRED_USER_EVENT_STATES, -1, &st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  StmtPtr guard(st, &sqlite3_finalize);

  BindU64(st, 1, now_ms);

  auto result = Translate(db, sqlite3_step(st));
  if (result) {
    deleted = static_cast<uint64_t>(sqlite3_changes(db));
  }
  return result;
}

} // namespace impact::db::sqlite
