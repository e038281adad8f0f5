#pragma once

#include "impact/v1.hpp"
#include "service_context.hpp"

namespace impact::service {

/*
  Store write path for the external ingestion jobs and the purge scheduler.
*/
class IngestService {
public:
  explicit IngestService(ServiceContext ctx);

  // All-or-nothing: every event is validated before the first write.
  impact::v1::UpsertEventsResponse
  UpsertEvents(const impact::v1::UpsertEventsRequest& req);

  impact::v1::PurgeExpiredResponse
  PurgeExpired(const impact::v1::PurgeExpiredRequest& req);

private:
  ServiceContext ctx_;
};

}
