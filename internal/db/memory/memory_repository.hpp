#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace impact::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                             UpsertEvent(Transaction&, model::EventRecord&) override;
  std::optional<model::EventRecord>  GetEvent(Transaction&, const std::string&) override;
  std::vector<model::EventRecord>    QueryEventsByBoundingBox(Transaction&, const EventBoxQuery&) override;
  std::vector<model::EventRecord>    QueryEventsByVersion(Transaction&, uint64_t since_version, std::optional<uint64_t> limit,
                                                          const std::vector<int>& source_types) override;
  uint64_t                           MaxEventVersion(Transaction&) override;

  Result InsertUserEventStateIfAbsent(Transaction&, const model::UserEventStateRecord&) override;
  std::optional<model::UserEventStateRecord> GetUserEventState(Transaction&, const std::string& user_id,
                                                               const std::string& event_id) override;
  std::vector<model::UserEventStateRecord>   ListUserEventStates(Transaction&, const std::string& user_id, bool unread_only) override;
  Result MarkUserEventStateRead(Transaction&, const std::string& user_id, const std::string& event_id, uint64_t read_at_ms) override;
  Result DeleteExpiredUserEventStates(Transaction&, uint64_t now_ms, uint64_t& deleted) override;

 private:
  friend class MemoryTransaction;

  using StateKey = std::pair<std::string, std::string>; // (user_id, event_id)

  struct State {
    std::map<std::string, model::EventRecord>     events;
    std::map<StateKey, model::UserEventStateRecord> user_states;
    uint64_t                                      max_version = 0;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace impact::db::memory
