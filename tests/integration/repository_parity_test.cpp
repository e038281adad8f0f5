#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/user_event_state_record.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

#if IMPACT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if IMPACT_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using impact::db::ErrorCode;
using impact::db::EventBoxQuery;
using impact::db::Repository;
using impact::db::memory::MemoryRepository;
using impact::db::model::EventRecord;
using impact::db::model::UserEventStateRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

/*
  Shared databases may already hold rows from earlier runs, so every check
  works on ids carrying a per-run prefix and compares versions relatively.
*/
struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              detects_write_conflicts = false;
};

EventRecord MakeRecord(const std::string& id, double lat, double lon, uint64_t start_ms, uint64_t expires_ms, int source_type = 1) {
  EventRecord r;
  r.id                = id;
  r.source_type       = source_type;
  r.geometry_json     = R"({"type":"Polygon","coordinates":[]})";
  r.min_lon           = lon - 0.05;
  r.max_lon           = lon + 0.05;
  r.min_lat           = lat - 0.05;
  r.max_lat           = lat + 0.05;
  r.start_ms          = start_ms;
  r.expires_ms        = expires_ms;
  r.severity          = "Moderate";
  r.headline          = "Lane closure";
  r.directionality    = "northbound";
  r.raw_metadata_json = R"({"source":"parity"})";
  return r;
}

bool HasPrefix(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> IdsWithPrefix(const std::vector<EventRecord>& rows, const std::string& prefix) {
  std::vector<std::string> out;
  for (const auto& r : rows) {
    if (HasPrefix(r.id, prefix)) out.push_back(r.id);
  }
  return out;
}

void VerifyUpsertAssignsIncreasingVersions(Repository& repo, const std::string& prefix) {
  uint64_t before = 0;
  {
    auto tx = repo.Begin();
    before  = repo.MaxEventVersion(*tx);
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto first = MakeRecord(prefix + "a", 29.6, -95.4, 1000, 5000);
  assert(repo.UpsertEvent(*tx, first));
  assert(first.version > before);

  auto second = MakeRecord(prefix + "b", 29.6, -95.4, 1000, 5000);
  assert(repo.UpsertEvent(*tx, second));
  assert(second.version > first.version);

  // A wall-clock updated_at larger than the counter wins.
  auto clocked          = MakeRecord(prefix + "c", 29.6, -95.4, 1000, 5000);
  clocked.updated_at_ms = std::max<uint64_t>(NowMs(), second.version + 1000);
  assert(repo.UpsertEvent(*tx, clocked));
  assert(clocked.version == clocked.updated_at_ms);

  // Re-upserting an id replaces the row and bumps its version.
  auto replaced     = first;
  replaced.headline = "Lane closure (updated)";
  assert(repo.UpsertEvent(*tx, replaced));
  assert(replaced.version > clocked.version);

  tx->Commit();

  auto read = repo.Begin();
  auto row  = repo.GetEvent(*read, prefix + "a");
  assert(row.has_value());
  assert(row->headline == "Lane closure (updated)");
  assert(row->version == replaced.version);
  assert(row->directionality == "northbound");
  assert(row->raw_metadata_json.find("parity") != std::string::npos);
  assert(!repo.GetEvent(*read, prefix + "missing").has_value());
  assert(repo.MaxEventVersion(*read) >= replaced.version);
  read->Commit();
}

void VerifyBoundingBoxAndWindowQuery(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();

    auto inside    = MakeRecord(prefix + "inside", 10.0, 20.0, 1000, 9000);
    auto far       = MakeRecord(prefix + "far", -10.0, -20.0, 1000, 9000);
    auto expired   = MakeRecord(prefix + "expired", 10.0, 20.0, 100, 500);
    auto future    = MakeRecord(prefix + "future", 10.0, 20.0, 20000, 30000);
    auto other_typ = MakeRecord(prefix + "weather", 10.0, 20.0, 1000, 9000, 3);

    for (auto* r : {&inside, &far, &expired, &future, &other_typ}) {
      assert(repo.UpsertEvent(*tx, *r));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  EventBoxQuery q;
  q.min_lon         = 19.9;
  q.max_lon         = 20.1;
  q.min_lat         = 9.9;
  q.max_lat         = 10.1;
  q.window_start_ms = 2000;
  q.window_end_ms   = 10000;

  auto ids = IdsWithPrefix(repo.QueryEventsByBoundingBox(*tx, q), prefix);
  assert((ids == std::vector<std::string>{prefix + "inside", prefix + "weather"}));

  q.source_types = {1};
  ids            = IdsWithPrefix(repo.QueryEventsByBoundingBox(*tx, q), prefix);
  assert((ids == std::vector<std::string>{prefix + "inside"}));

  // Lookahead reaches the future event.
  q.source_types.clear();
  q.window_end_ms = 25000;
  ids             = IdsWithPrefix(repo.QueryEventsByBoundingBox(*tx, q), prefix);
  assert(std::find(ids.begin(), ids.end(), prefix + "future") != ids.end());

  // Partial overlap counts.
  q.min_lon = 20.04;
  q.max_lon = 21.0;
  ids       = IdsWithPrefix(repo.QueryEventsByBoundingBox(*tx, q), prefix);
  assert(std::find(ids.begin(), ids.end(), prefix + "inside") != ids.end());

  tx->Commit();
}

void VerifyVersionQuery(Repository& repo, const std::string& prefix) {
  uint64_t since = 0;
  {
    auto tx = repo.Begin();
    since   = repo.MaxEventVersion(*tx);
    for (int i = 0; i < 4; ++i) {
      auto r = MakeRecord(prefix + std::to_string(i), 0.0, 0.0, 0, 1000, i % 2 == 0 ? 1 : 2);
      assert(repo.UpsertEvent(*tx, r));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto all = repo.QueryEventsByVersion(*tx, since, std::nullopt, {});
  assert(all.size() == 4);
  for (size_t i = 1; i < all.size(); ++i) {
    assert(all[i - 1].version < all[i].version);
  }
  assert(all.front().id == prefix + "0");

  auto page = repo.QueryEventsByVersion(*tx, since, 2, {});
  assert(page.size() == 2);
  assert(page[1].id == prefix + "1");

  auto rest = repo.QueryEventsByVersion(*tx, page.back().version, 10, {});
  assert(rest.size() == 2);
  assert(rest.front().id == prefix + "2");

  auto typed = repo.QueryEventsByVersion(*tx, since, std::nullopt, {2});
  assert(typed.size() == 2);
  assert(typed[0].id == prefix + "1" && typed[1].id == prefix + "3");

  assert(repo.QueryEventsByVersion(*tx, all.back().version, std::nullopt, {}).empty());
  tx->Commit();
}

void VerifyUserEventState(Repository& repo, const std::string& prefix) {
  const std::string user = prefix + "user";

  {
    auto tx = repo.Begin();

    UserEventStateRecord a{.user_id = user, .event_id = prefix + "e1", .delivered_at_ms = 200, .event_expires_ms = 1000};
    UserEventStateRecord b{.user_id = user, .event_id = prefix + "e2", .delivered_at_ms = 100, .event_expires_ms = 2000};
    assert(repo.InsertUserEventStateIfAbsent(*tx, a));
    assert(repo.InsertUserEventStateIfAbsent(*tx, b));

    auto dup = a;
    dup.delivered_at_ms = 999;
    auto again          = repo.InsertUserEventStateIfAbsent(*tx, dup);
    assert(!again);
    assert(again.code == ErrorCode::AlreadyExists);

    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto row = repo.GetUserEventState(*tx, user, prefix + "e1");
    assert(row.has_value());
    assert(row->delivered_at_ms == 200);
    assert(!row->read);
    assert(row->event_expires_ms == 1000);

    auto listed = repo.ListUserEventStates(*tx, user, false);
    assert(listed.size() == 2);
    assert(listed[0].event_id == prefix + "e2");
    assert(listed[1].event_id == prefix + "e1");

    assert(repo.MarkUserEventStateRead(*tx, user, prefix + "e1", 300));
    assert(repo.MarkUserEventStateRead(*tx, user, prefix + "e1", 400));

    auto missing = repo.MarkUserEventStateRead(*tx, user, prefix + "nope", 300);
    assert(missing.code == ErrorCode::NotFound);
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto row = repo.GetUserEventState(*tx, user, prefix + "e1");
    assert(row.has_value());
    assert(row->read);
    assert(row->read_at_ms == 300);

    auto unread = repo.ListUserEventStates(*tx, user, true);
    assert(unread.size() == 1);
    assert(unread[0].event_id == prefix + "e2");

    assert(repo.ListUserEventStates(*tx, prefix + "nobody", false).empty());
    tx->Commit();
  }

  {
    auto     tx      = repo.Begin();
    uint64_t deleted = 0;
    assert(repo.DeleteExpiredUserEventStates(*tx, 1500, deleted));
    assert(deleted >= 1);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.GetUserEventState(*tx, user, prefix + "e1").has_value());
    assert(repo.GetUserEventState(*tx, user, prefix + "e2").has_value());

    uint64_t deleted = 0;
    assert(repo.DeleteExpiredUserEventStates(*tx, 2500, deleted));
    assert(deleted >= 1);
    assert(repo.ListUserEventStates(*tx, user, false).empty());
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    auto r  = MakeRecord(prefix + "rolled", 1.0, 1.0, 0, 1000);
    assert(repo.UpsertEvent(*tx, r));

    UserEventStateRecord s{.user_id = prefix + "user", .event_id = prefix + "rolled", .delivered_at_ms = 1, .event_expires_ms = 1000};
    assert(repo.InsertUserEventStateIfAbsent(*tx, s));
    tx->Rollback();
  }

  {
    // Destroyed without commit.
    auto tx = repo.Begin();
    auto r  = MakeRecord(prefix + "dropped", 1.0, 1.0, 0, 1000);
    assert(repo.UpsertEvent(*tx, r));
  }

  auto tx = repo.Begin();
  assert(!repo.GetEvent(*tx, prefix + "rolled").has_value());
  assert(!repo.GetEvent(*tx, prefix + "dropped").has_value());
  assert(!repo.GetUserEventState(*tx, prefix + "user", prefix + "rolled").has_value());
  tx->Commit();
}

void VerifyWriteConflict(Repository& repo, const std::string& prefix, bool detects_write_conflicts) {
  if (!detects_write_conflicts) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  UserEventStateRecord s{.user_id = prefix + "user", .event_id = prefix + "race", .delivered_at_ms = 1, .event_expires_ms = 1000};
  assert(repo.InsertUserEventStateIfAbsent(*tx1, s));
  assert(repo.InsertUserEventStateIfAbsent(*tx2, s));

  tx1->Commit();

  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const impact::util::TransactionConflict&) {
    conflicted = true;
  }
  assert(conflicted);

  auto verify = repo.Begin();
  assert(repo.ListUserEventStates(*verify, prefix + "user", false).size() == 1);
  verify->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto     repo    = backend.make_repository();
  uint64_t version = 0;
  {
    auto tx = repo->Begin();
    auto r  = MakeRecord(prefix + "durable", 5.0, 5.0, 0, 1000);
    assert(repo->UpsertEvent(*tx, r));
    version = r.version;

    UserEventStateRecord s{.user_id = prefix + "user", .event_id = prefix + "durable", .delivered_at_ms = 7, .event_expires_ms = NowMs() + 60000};
    assert(repo->InsertUserEventStateIfAbsent(*tx, s));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto row = repo->GetEvent(*tx, prefix + "durable");
  assert(row.has_value());
  assert(row->version == version);
  assert(repo->MaxEventVersion(*tx) >= version);

  auto state = repo->GetUserEventState(*tx, prefix + "user", prefix + "durable");
  assert(state.has_value());
  assert(state->delivered_at_ms == 7);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                    = "memory",
      .make_repository         = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart        = []() { return false; },
      .restart                 = [](std::shared_ptr<Repository>&) {},
      .cleanup                 = []() {},
      .detects_write_conflicts = true,
  };
}

#if IMPACT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("impact_engine_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<impact::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : impact::db::sql::kSqliteSchema) {
      db->Exec(sql);
    }
    return std::make_shared<impact::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                    = "sqlite",
      .make_repository         = make_repo,
      .supports_restart        = []() { return true; },
      .restart                 = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                 = [db_path]() { std::filesystem::remove(db_path); },
      .detects_write_conflicts = false,
  };
}
#endif

#if IMPACT_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("IMPACT_PG_TEST_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("IMPACT_PG_TEST_URI is not set");
  }

  auto conninfo = std::string(uri);
  {
    pqxx::connection conn(conninfo);
    pqxx::work       tx(conn);
    for (const auto& sql : impact::db::sql::kPostgresSchema) {
      tx.exec(sql);
    }
    tx.commit();
  }

  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<impact::db::postgres::PgPool>(conninfo, 4);
    return std::make_shared<impact::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                    = "postgres",
      .make_repository         = make_repo,
      .supports_restart        = []() { return true; },
      .restart                 = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                 = []() {},
      .detects_write_conflicts = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  const auto run = backend.name + "-" + std::to_string(NowMs()) + "-";

  VerifyUpsertAssignsIncreasingVersions(*repo, run + "upsert-");
  VerifyBoundingBoxAndWindowQuery(*repo, run + "bbox-");
  VerifyVersionQuery(*repo, run + "version-");
  VerifyUserEventState(*repo, run + "state-");
  VerifyRollbackBehavior(*repo, run + "rollback-");
  VerifyWriteConflict(*repo, run + "conflict-", backend.detects_write_conflicts);

  repo.reset();
  VerifyRestartDurability(backend, run + "restart-");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if IMPACT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if IMPACT_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "impact_engine_integration_repository_parity: pass\n";
  return 0;
}
