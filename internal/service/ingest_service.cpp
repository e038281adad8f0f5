#include "ingest_service.hpp"

#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/notify/notification_targeting.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapper.hpp"
#include "internal/store/event_mapper.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace impact::service {

using namespace impact::v1;

namespace {

void ThrowIfDbError(const impact::db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  const auto message = prefix + ": " + std::string(impact::db::ToString(result.code)) + " " + result.message;
  if (result.code == impact::db::ErrorCode::Conflict || result.code == impact::db::ErrorCode::SerializationFailure ||
      result.code == impact::db::ErrorCode::Busy) {
    throw util::TransactionConflict(message);
  }
  throw util::ServiceUnavailable(message);
}

} // namespace

IngestService::IngestService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

UpsertEventsResponse IngestService::UpsertEvents(const UpsertEventsRequest& req) {
  return ObserveRpc("EventIngestService.UpsertEvents", "", [&] {
    std::vector<model::Event> events;
    events.reserve(req.events_size());
    for (const auto& event : req.events()) {
      events.push_back(EventFromProto(event, ctx_.geojson));
    }

    const auto now_ms = util::ToUnixMillis(ctx_.clock());

    UpsertEventsResponse resp;
    auto                 tx = ctx_.repository->Begin();
    for (const auto& event : events) {
      const bool existed = ctx_.repository->GetEvent(*tx, event.id).has_value();

      auto record          = store::ToRecord(event);
      record.updated_at_ms = now_ms;
      ThrowIfDbError(ctx_.repository->UpsertEvent(*tx, record), "upsert event " + event.id);

      auto* result = resp.add_results();
      result->set_id(event.id);
      result->set_created(!existed);
      result->set_version(record.version);
    }
    tx->Commit();

    IMPACT_LOG_INFO("events ingested", {observability::IntField("count", static_cast<int64_t>(events.size()))});
    return resp;
  });
}

PurgeExpiredResponse IngestService::PurgeExpired(const PurgeExpiredRequest& req) {
  return ObserveRpc("EventIngestService.PurgeExpired", "", [&] {
    const auto now = req.has_now() ? util::FromProto(req.now()) : ctx_.clock();

    PurgeExpiredResponse resp;
    resp.set_purged_states(ctx_.targeting->PurgeExpired(now));
    return resp;
  });
}

}
