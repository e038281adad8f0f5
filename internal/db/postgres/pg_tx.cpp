#include "pg_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace impact::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : conn_(pool->Acquire()) {
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      IMPACT_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // The work object must be gone before the connection returns to the pool.
  tx_.reset();
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  committed_ = true;
}

} // namespace impact::db::postgres
