#include "impact_service.hpp"

#include <chrono>
#include <string>

#include "internal/geo/polyline_codec.hpp"
#include "internal/notify/notification_targeting.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/service/proto_mapper.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace impact::service {

using namespace impact::v1;

ImpactService::ImpactService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetIncidentEventsResponse ImpactService::GetIncidentEvents(const GetIncidentEventsRequest& req) {
  return ObserveRpc("IncidentImpactService.GetIncidentEvents", "", [&] {
    if (!req.has_bbox()) {
      throw util::ValidationError("bbox is required");
    }

    auto polled = ctx_.targeting->Poll(req.version(), FromProto(req.bbox()));

    GetIncidentEventsResponse resp;
    for (const auto& item : polled.events) {
      auto* event = resp.add_events();
      *event->mutable_event() = ToProto(*item.event);
      event->set_is_affected(item.is_affected);
    }
    resp.set_version(polled.version);
    resp.set_has_more(polled.has_more);
    return resp;
  });
}

GetUserInformaticEventsResponse ImpactService::GetUserInformaticEvents(const GetUserInformaticEventsRequest& req,
                                                                       std::function<bool()> is_cancelled) {
  return ObserveRpc("IncidentImpactService.GetUserInformaticEvents", req.user_id(), [&] {
    notify::AffectingRequest request;
    request.user_id      = req.user_id();
    request.routes       = RouteInputsFromProto(req.routes());
    request.types        = SourceTypesFromProto(req.types());
    request.is_cancelled = std::move(is_cancelled);
    if (req.has_departure_time()) {
      request.departure = util::FromProto(req.departure_time());
    }
    if (req.deadline_ms() > 0) {
      request.deadline = std::chrono::milliseconds(req.deadline_ms());
    }

    GetUserInformaticEventsResponse resp;
    for (const auto& route : ctx_.targeting->AffectingEvents(request)) {
      auto* out = resp.add_routes();
      out->set_route_id(route.route_id);
      out->set_status(ToProto(route.status));
      out->set_error_message(route.error_message);
      out->set_truncated(route.truncated);
      out->set_vertex_count(static_cast<uint32_t>(route.vertex_count));
      for (const auto& view : route.events) {
        *out->add_events() = ToProto(view);
      }
    }
    return resp;
  });
}

DecodePolylineResponse ImpactService::DecodePolyline(const DecodePolylineRequest& req) {
  return ObserveRpc("IncidentImpactService.DecodePolyline", "", [&] {
    DecodePolylineResponse resp;

    auto decoded = ctx_.codec->Decode(req.polyline(), FromProto(req.format()));
    if (!decoded) {
      const auto& error = *decoded.error;
      resp.set_warning("polyline could not be decoded: " + std::string(geo::ToString(error.kind)) + " at position " +
                       std::to_string(error.position));
      IMPACT_LOG_WARN("polyline decode failed", {observability::StringField("kind", geo::ToString(error.kind)),
                                                 observability::IntField("position", static_cast<int64_t>(error.position))});
      return resp;
    }

    for (const auto& point : decoded.coordinates) {
      *resp.add_coordinates() = ToProto(point);
    }
    return resp;
  });
}

GetUnreadEventsResponse ImpactService::GetUnreadEvents(const GetUnreadEventsRequest& req, std::function<bool()> is_cancelled) {
  return ObserveRpc("IncidentImpactService.GetUnreadEvents", req.user_id(), [&] {
    notify::UnreadRequest request;
    request.user_id      = req.user_id();
    request.routes       = RouteInputsFromProto(req.routes());
    request.is_cancelled = std::move(is_cancelled);
    if (req.has_location()) {
      request.location = FromProto(req.location());
    }
    if (req.has_departure_time()) {
      request.departure = util::FromProto(req.departure_time());
    }

    GetUnreadEventsResponse resp;
    for (const auto& view : ctx_.targeting->UnreadEvents(request)) {
      *resp.add_events() = ToProto(view);
    }
    resp.set_unread_count(static_cast<uint32_t>(resp.events_size()));
    return resp;
  });
}

AcknowledgeEventsResponse ImpactService::AcknowledgeEvents(const AcknowledgeEventsRequest& req) {
  return ObserveRpc("IncidentImpactService.AcknowledgeEvents", req.user_id(), [&] {
    std::vector<std::string> ids(req.event_ids().begin(), req.event_ids().end());

    AcknowledgeEventsResponse resp;
    for (const auto& outcome : ctx_.targeting->Acknowledge(req.user_id(), ids)) {
      auto* result = resp.add_results();
      result->set_event_id(outcome.event_id);
      result->set_ok(outcome.ok);
      result->set_error_message(outcome.error);
    }
    return resp;
  });
}

}
