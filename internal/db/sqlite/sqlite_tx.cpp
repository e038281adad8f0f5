#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace impact::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->Mutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      IMPACT_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace impact::db::sqlite
