#pragma once

#include <functional>

#include "impact/v1.hpp"
#include "service_context.hpp"

namespace impact::service {

/*
  Read side of the engine: incident polling, route impact, polyline decode
  and per-user unread/acknowledge.

  is_cancelled is probed during route evaluation (client cancellation).
*/
class ImpactService {
public:
  explicit ImpactService(ServiceContext ctx);

  impact::v1::GetIncidentEventsResponse
  GetIncidentEvents(const impact::v1::GetIncidentEventsRequest& req);

  impact::v1::GetUserInformaticEventsResponse
  GetUserInformaticEvents(const impact::v1::GetUserInformaticEventsRequest& req, std::function<bool()> is_cancelled = {});

  impact::v1::DecodePolylineResponse
  DecodePolyline(const impact::v1::DecodePolylineRequest& req);

  impact::v1::GetUnreadEventsResponse
  GetUnreadEvents(const impact::v1::GetUnreadEventsRequest& req, std::function<bool()> is_cancelled = {});

  impact::v1::AcknowledgeEventsResponse
  AcknowledgeEvents(const impact::v1::AcknowledgeEventsRequest& req);

private:
  ServiceContext ctx_;
};

}
