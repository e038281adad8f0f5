#include "event_store_gateway.hpp"

#include <exception>
#include <string_view>
#include <utility>

#include "event_mapper.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace impact::store {

namespace {

std::vector<int> ToStoreTypes(const std::vector<model::SourceType>& types) {
  std::vector<int> out;
  out.reserve(types.size());
  for (auto type : types) {
    out.push_back(static_cast<int>(type));
  }
  return out;
}

EventSnapshot ToSnapshot(const std::vector<db::model::EventRecord>& records) {
  EventSnapshot out;
  out.reserve(records.size());
  for (const auto& record : records) {
    try {
      out.push_back(std::make_shared<const model::Event>(ToDomain(record)));
    } catch (const util::ValidationError& e) {
      // Ingestion validates geometry, so this is a damaged row. Skip it
      // rather than failing every request that touches the area.
      IMPACT_LOG_ERROR("skipping stored event with unreadable geometry",
                       {observability::StringField("event_id", record.id), observability::StringField("error", e.what())});
    }
  }
  return out;
}

/*
  Runs fn inside a read transaction. Anything the store throws becomes
  ServiceUnavailable; there is no retry here.
*/
template <typename Fn>
auto WithReadTransaction(db::Repository& repository, std::string_view op, Fn&& fn) {
  try {
    auto tx     = repository.Begin();
    auto result = fn(*tx);
    tx->Commit();
    return result;
  } catch (const std::exception& e) {
    IMPACT_LOG_WARN("event store query failed", {observability::StringField("op", op), observability::StringField("error", e.what())});
    throw util::ServiceUnavailable(std::string("event store unavailable: ") + e.what());
  }
}

} // namespace

EventStoreGateway::EventStoreGateway(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

EventSnapshot EventStoreGateway::QueryByBoundingBox(const BoxQuery& query) const {
  geo::ValidateBoundingBox(query.box);

  db::EventBoxQuery q;
  q.min_lon         = query.box.min_lon;
  q.min_lat         = query.box.min_lat;
  q.max_lon         = query.box.max_lon;
  q.max_lat         = query.box.max_lat;
  q.window_start_ms = util::ToUnixMillis(query.as_of);
  q.window_end_ms   = util::ToUnixMillis(query.as_of + query.lookahead);
  q.source_types    = ToStoreTypes(query.types);

  auto records = WithReadTransaction(*repository_, "query_by_bbox", [&](db::Transaction& tx) { return repository_->QueryEventsByBoundingBox(tx, q); });
  return ToSnapshot(records);
}

VersionPage EventStoreGateway::QueryByVersion(uint64_t since_version, std::optional<uint64_t> limit,
                                              const std::vector<model::SourceType>& types) const {
  const auto store_types = ToStoreTypes(types);
  auto       records     = WithReadTransaction(*repository_, "query_by_version", [&](db::Transaction& tx) {
    return repository_->QueryEventsByVersion(tx, since_version, limit, store_types);
  });

  VersionPage page;
  page.next_version = records.empty() ? since_version : records.back().version;
  page.has_more     = limit && records.size() == *limit;
  page.events       = ToSnapshot(records);
  return page;
}

uint64_t EventStoreGateway::CurrentVersion() const {
  return WithReadTransaction(*repository_, "current_version", [&](db::Transaction& tx) { return repository_->MaxEventVersion(tx); });
}

EventSnapshot EventStoreGateway::GetByIds(const std::vector<std::string>& ids) const {
  auto records = WithReadTransaction(*repository_, "get_by_ids", [&](db::Transaction& tx) {
    std::vector<db::model::EventRecord> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
      if (auto record = repository_->GetEvent(tx, id)) {
        out.push_back(std::move(*record));
      }
    }
    return out;
  });
  return ToSnapshot(records);
}

} // namespace impact::store
