#pragma once

#include <exception>
#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace impact::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result                            UpsertEvent(Transaction&, model::EventRecord&) override;
  std::optional<model::EventRecord> GetEvent(Transaction&, const std::string&) override;
  std::vector<model::EventRecord>   QueryEventsByBoundingBox(Transaction&, const EventBoxQuery&) override;
  std::vector<model::EventRecord>   QueryEventsByVersion(Transaction&, uint64_t since_version, std::optional<uint64_t> limit,
                                                         const std::vector<int>& source_types) override;
  uint64_t                          MaxEventVersion(Transaction&) override;

  Result InsertUserEventStateIfAbsent(Transaction&, const model::UserEventStateRecord&) override;
  std::optional<model::UserEventStateRecord> GetUserEventState(Transaction&, const std::string& user_id,
                                                               const std::string& event_id) override;
  std::vector<model::UserEventStateRecord>   ListUserEventStates(Transaction&, const std::string& user_id, bool unread_only) override;
  Result MarkUserEventStateRead(Transaction&, const std::string& user_id, const std::string& event_id, uint64_t read_at_ms) override;
  Result DeleteExpiredUserEventStates(Transaction&, uint64_t now_ms, uint64_t& deleted) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace impact::db::postgres
