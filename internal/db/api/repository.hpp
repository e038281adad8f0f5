#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/query.hpp"
#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/user_event_state_record.hpp"

namespace impact::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - Event version assignment is atomic with the upsert
  - InsertUserEventStateIfAbsent never creates a second row for a pair

  Read failures throw; write failures are reported as Result codes.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Inserts or replaces by id. Assigns record.version =
  // max(record.updated_at_ms, current max version + 1).
  virtual Result UpsertEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::optional<model::EventRecord> GetEvent(Transaction&, const std::string& id) = 0;

  // Ordered by version ascending.
  virtual std::vector<model::EventRecord> QueryEventsByBoundingBox(Transaction&, const EventBoxQuery& query) = 0;

  // version > since_version, ordered by version ascending.
  virtual std::vector<model::EventRecord> QueryEventsByVersion(Transaction&, uint64_t since_version, std::optional<uint64_t> limit,
                                                               const std::vector<int>& source_types) = 0;

  // 0 when the store is empty.
  virtual uint64_t MaxEventVersion(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // User event state
  // ---------------------------------------------------------------------

  // AlreadyExists when a row for (user_id, event_id) is present.
  virtual Result InsertUserEventStateIfAbsent(Transaction&, const model::UserEventStateRecord&) = 0;

  virtual std::optional<model::UserEventStateRecord> GetUserEventState(Transaction&, const std::string& user_id,
                                                                       const std::string& event_id) = 0;

  virtual std::vector<model::UserEventStateRecord> ListUserEventStates(Transaction&, const std::string& user_id, bool unread_only) = 0;

  // Idempotent. NotFound when the pair has no row.
  virtual Result MarkUserEventStateRead(Transaction&, const std::string& user_id, const std::string& event_id, uint64_t read_at_ms) = 0;

  // Deletes rows with event_expires_ms < now_ms.
  virtual Result DeleteExpiredUserEventStates(Transaction&, uint64_t now_ms, uint64_t& deleted) = 0;
};

} // namespace impact::db
