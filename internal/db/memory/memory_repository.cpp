#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace impact::db::memory {

namespace {

bool TypeMatches(const std::vector<int>& source_types, int type) {
  return source_types.empty() || std::find(source_types.begin(), source_types.end(), type) != source_types.end();
}

bool ByVersion(const model::EventRecord& a, const model::EventRecord& b) {
  return a.version < b.version;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertEvent(Transaction& t, model::EventRecord& r) {
  auto& s = TX(t).Mutable();

  r.version     = std::max(r.updated_at_ms, s.max_version + 1);
  s.max_version = r.version;
  s.events[r.id] = r;
  return Result::Ok();
}

std::optional<model::EventRecord> MemoryRepository::GetEvent(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(id);
  if (it == s.events.end()) return std::nullopt;
  return it->second;
}

std::vector<model::EventRecord> MemoryRepository::QueryEventsByBoundingBox(Transaction& t, const EventBoxQuery& q) {
  const auto&                     s = TX(t).View();
  std::vector<model::EventRecord> out;
  for (const auto& [_, r] : s.events) {
    if (r.max_lon < q.min_lon || r.min_lon > q.max_lon || r.max_lat < q.min_lat || r.min_lat > q.max_lat) continue;
    if (r.start_ms > q.window_end_ms || r.expires_ms < q.window_start_ms) continue;
    if (!TypeMatches(q.source_types, r.source_type)) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), ByVersion);
  return out;
}

std::vector<model::EventRecord> MemoryRepository::QueryEventsByVersion(Transaction& t, uint64_t since_version, std::optional<uint64_t> limit,
                                                                       const std::vector<int>& source_types) {
  const auto&                     s = TX(t).View();
  std::vector<model::EventRecord> out;
  for (const auto& [_, r] : s.events) {
    if (r.version <= since_version) continue;
    if (!TypeMatches(source_types, r.source_type)) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), ByVersion);
  if (limit && out.size() > *limit) {
    out.resize(*limit);
  }
  return out;
}

uint64_t MemoryRepository::MaxEventVersion(Transaction& t) {
  return TX(t).View().max_version;
}

Result MemoryRepository::InsertUserEventStateIfAbsent(Transaction& t, const model::UserEventStateRecord& r) {
  StateKey key{r.user_id, r.event_id};
  if (TX(t).View().user_states.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().user_states.emplace(std::move(key), r);
  return Result::Ok();
}

std::optional<model::UserEventStateRecord> MemoryRepository::GetUserEventState(Transaction& t, const std::string& user_id,
                                                                                const std::string& event_id) {
  const auto& s  = TX(t).View();
  auto        it = s.user_states.find({user_id, event_id});
  if (it == s.user_states.end()) return std::nullopt;
  return it->second;
}

std::vector<model::UserEventStateRecord> MemoryRepository::ListUserEventStates(Transaction& t, const std::string& user_id, bool unread_only) {
  const auto&                              s = TX(t).View();
  std::vector<model::UserEventStateRecord> out;
  for (auto it = s.user_states.lower_bound({user_id, std::string()}); it != s.user_states.end() && it->first.first == user_id; ++it) {
    if (unread_only && it->second.read) continue;
    out.push_back(it->second);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    return a.delivered_at_ms != b.delivered_at_ms ? a.delivered_at_ms < b.delivered_at_ms : a.event_id < b.event_id;
  });
  return out;
}

Result MemoryRepository::MarkUserEventStateRead(Transaction& t, const std::string& user_id, const std::string& event_id, uint64_t read_at_ms) {
  if (!TX(t).View().user_states.contains({user_id, event_id})) return Result::Err(ErrorCode::NotFound);

  auto& row = TX(t).Mutable().user_states.at({user_id, event_id});
  if (!row.read) {
    row.read       = true;
    row.read_at_ms = read_at_ms;
  }
  return Result::Ok();
}

Result MemoryRepository::DeleteExpiredUserEventStates(Transaction& t, uint64_t now_ms, uint64_t& deleted) {
  deleted = 0;
  auto& states = TX(t).Mutable().user_states;
  for (auto it = states.begin(); it != states.end();) {
    if (it->second.event_expires_ms < now_ms) {
      it = states.erase(it);
      ++deleted;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

} // namespace impact::db::memory
