#include <cassert>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/impact_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/service/impact_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "impact/v1.hpp"

namespace {

using namespace impact::v1;
using impact::util::TimePoint;

constexpr const char* kHoustonPolyline = "_v`sD~i{eQ_pR_pR_pR_pR";
constexpr const char* kScenarioPolygon =
    R"({"type":"Polygon","coordinates":[[[-95.55,29.55],[-95.35,29.55],[-95.35,29.65],[-95.55,29.65],[-95.55,29.55]]]})";

struct Services {
  impact::service::ServiceContext                  ctx;
  std::shared_ptr<impact::service::ImpactService>  impact;
  std::shared_ptr<impact::service::IngestService>  ingest;
};

Services BuildServices() {
  Services s;
  s.ctx    = impact::factory::BuildContext(impact::runtime::config::EngineConfig{}, std::make_shared<impact::db::memory::MemoryRepository>());
  s.impact = std::make_shared<impact::service::ImpactService>(s.ctx);
  s.ingest = std::make_shared<impact::service::IngestService>(s.ctx);
  return s;
}

Event MakeEvent(const std::string& id, const std::string& geojson, TimePoint start, TimePoint expires) {
  Event event;
  event.set_id(id);
  event.set_source_type(SOURCE_TYPE_INCIDENT);
  event.set_geometry_geojson(geojson);
  *event.mutable_validity_window()->mutable_start()   = impact::util::ToProto(start);
  *event.mutable_validity_window()->mutable_expires() = impact::util::ToProto(expires);
  event.set_headline("Crash on I-45");
  return event;
}

UpsertEventsResponse Ingest(Services& s, const Event& event) {
  UpsertEventsRequest req;
  *req.add_events() = event;
  return s.ingest->UpsertEvents(req);
}

GetUserInformaticEventsRequest HoustonRequest(const std::string& user_id, TimePoint departure) {
  GetUserInformaticEventsRequest req;
  req.set_user_id(user_id);
  auto* route = req.add_routes();
  route->set_id("commute");
  route->set_polyline(kHoustonPolyline);
  route->set_format(POLYLINE_FORMAT_GOOGLE);
  *req.mutable_departure_time() = impact::util::ToProto(departure);
  return req;
}

void TestActiveEventOnRouteIsAffecting() {
  auto       s   = BuildServices();
  const auto now = impact::util::Now();
  Ingest(s, MakeEvent("e1", kScenarioPolygon, now - std::chrono::minutes(30), now + std::chrono::minutes(90)));

  auto resp = s.impact->GetUserInformaticEvents(HoustonRequest("alice", now));
  assert(resp.routes_size() == 1);
  const auto& route = resp.routes(0);
  assert(route.status() == ROUTE_STATUS_OK);
  assert(route.events_size() == 1);
  assert(route.events(0).is_affected());
  assert(route.events(0).event().id() == "e1");
  assert(route.events(0).newly_delivered());

  // eta ~14.7 min after departure
  const auto eta = impact::util::FromProto(route.events(0).eta());
  assert(eta > now + std::chrono::minutes(14) && eta < now + std::chrono::minutes(16));
}

void TestExpiredEventIsNotReturned() {
  auto       s   = BuildServices();
  const auto now = impact::util::Now();
  Ingest(s, MakeEvent("e1", kScenarioPolygon, now - std::chrono::hours(2), now - std::chrono::minutes(1)));

  auto resp = s.impact->GetUserInformaticEvents(HoustonRequest("alice", now));
  assert(resp.routes(0).status() == ROUTE_STATUS_OK);
  assert(resp.routes(0).events_size() == 0);
}

void TestBoundingBoxExcludesEventOutsideIt() {
  auto       s   = BuildServices();
  const auto now = impact::util::Now();
  Ingest(s, MakeEvent("far", R"({"type":"Point","coordinates":[-94.0,29.7]})", now - std::chrono::minutes(5), now + std::chrono::hours(1)));
  Ingest(s, MakeEvent("near", R"({"type":"Point","coordinates":[-95.2,29.7]})", now - std::chrono::minutes(5), now + std::chrono::hours(1)));

  GetIncidentEventsRequest req;
  req.mutable_bbox()->set_min_lon(-95.5);
  req.mutable_bbox()->set_min_lat(29.5);
  req.mutable_bbox()->set_max_lon(-95.0);
  req.mutable_bbox()->set_max_lat(30.0);
  req.set_version(0);

  auto resp = s.impact->GetIncidentEvents(req);
  assert(resp.events_size() == 1);
  assert(resp.events(0).event().id() == "near");
  assert(resp.events(0).is_affected());
  assert(resp.version() >= resp.events(0).event().version());

  req.set_version(resp.version());
  auto next = s.impact->GetIncidentEvents(req);
  assert(next.events_size() == 0);
  assert(next.version() == resp.version());
  assert(!next.has_more());
}

void TestInvalidPolylineDegradesToWarning() {
  auto s = BuildServices();

  DecodePolylineRequest req;
  req.set_polyline("!!!invalid!!!");
  req.set_format(POLYLINE_FORMAT_GOOGLE);

  auto resp = s.impact->DecodePolyline(req);
  assert(resp.coordinates_size() == 0);
  assert(!resp.warning().empty());

  req.set_polyline(kHoustonPolyline);
  resp = s.impact->DecodePolyline(req);
  assert(resp.coordinates_size() == 3);
  assert(resp.warning().empty());
  assert(resp.coordinates(2).lat() > 29.69 && resp.coordinates(2).lat() < 29.71);
}

void TestReingestUpdatesInPlace() {
  auto       s   = BuildServices();
  const auto now = impact::util::Now();

  auto first = Ingest(s, MakeEvent("e1", kScenarioPolygon, now - std::chrono::minutes(5), now + std::chrono::hours(1)));
  assert(first.results(0).created());

  auto second = Ingest(s, MakeEvent("e1", R"({"type":"Point","coordinates":[-95.4,29.6]})", now - std::chrono::minutes(5), now + std::chrono::hours(1)));
  assert(!second.results(0).created());
  assert(second.results(0).version() > first.results(0).version());

  GetIncidentEventsRequest req;
  req.mutable_bbox()->set_min_lon(-96.0);
  req.mutable_bbox()->set_min_lat(29.0);
  req.mutable_bbox()->set_max_lon(-95.0);
  req.mutable_bbox()->set_max_lat(30.0);

  auto resp = s.impact->GetIncidentEvents(req);
  assert(resp.events_size() == 1);
  assert(resp.events(0).event().version() == second.results(0).version());
}

void TestUnreadAndAcknowledge() {
  auto       s   = BuildServices();
  const auto now = impact::util::Now();
  Ingest(s, MakeEvent("e1", kScenarioPolygon, now - std::chrono::minutes(30), now + std::chrono::minutes(90)));
  (void)s.impact->GetUserInformaticEvents(HoustonRequest("alice", now));

  GetUnreadEventsRequest unread_req;
  unread_req.set_user_id("alice");
  auto unread = s.impact->GetUnreadEvents(unread_req);
  assert(unread.unread_count() == 1);
  assert(unread.events(0).event().id() == "e1");

  AcknowledgeEventsRequest ack;
  ack.set_user_id("alice");
  ack.add_event_ids("e1");
  ack.add_event_ids("nope");
  auto acked = s.impact->AcknowledgeEvents(ack);
  assert(acked.results_size() == 2);
  assert(acked.results(0).ok());
  assert(!acked.results(1).ok());

  assert(s.impact->GetUnreadEvents(unread_req).unread_count() == 0);

  auto again = s.impact->GetUserInformaticEvents(HoustonRequest("alice", now));
  assert(again.routes(0).events(0).read());
}

bool RejectsRoute(Services& s, double speed_kph, std::initializer_list<double> offsets) {
  auto req = HoustonRequest("alice", std::chrono::system_clock::now());
  auto* route = req.mutable_routes(0);
  route->set_average_speed_kph(speed_kph);
  for (const double offset : offsets) {
    route->add_vertex_offsets_sec(offset);
  }
  try {
    (void)s.impact->GetUserInformaticEvents(req);
  } catch (const impact::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestRouteTimingInputsAreValidated() {
  auto s = BuildServices();

  assert(RejectsRoute(s, -5.0, {}));
  assert(RejectsRoute(s, std::numeric_limits<double>::infinity(), {}));
  assert(RejectsRoute(s, std::numeric_limits<double>::quiet_NaN(), {}));
  assert(RejectsRoute(s, 0.0, {0.0, 600.0, std::numeric_limits<double>::infinity()}));
  assert(RejectsRoute(s, 0.0, {-1.0, 600.0, 1200.0}));
  assert(RejectsRoute(s, 0.0, {0.0, 1200.0, 600.0}));

  assert(!RejectsRoute(s, 45.0, {}));
  assert(!RejectsRoute(s, 0.0, {0.0, 600.0, 600.0}));
}

void TestServerTranslatesErrors() {
  auto                         s = BuildServices();
  impact::grpc::ImpactServer   server(s.impact);
  impact::grpc::IngestServer   ingest_server(s.ingest);
  ::grpc::ServerContext        grpc_ctx;

  GetIncidentEventsRequest bad_box;
  bad_box.mutable_bbox()->set_min_lon(-95.0);
  bad_box.mutable_bbox()->set_min_lat(29.5);
  bad_box.mutable_bbox()->set_max_lon(-95.5);
  bad_box.mutable_bbox()->set_max_lat(30.0);
  GetIncidentEventsResponse box_resp;
  assert(server.GetIncidentEvents(&grpc_ctx, &bad_box, &box_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  GetIncidentEventsRequest missing_box;
  assert(server.GetIncidentEvents(&grpc_ctx, &missing_box, &box_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  GetUnreadEventsRequest no_user;
  GetUnreadEventsResponse unread_resp;
  assert(server.GetUnreadEvents(&grpc_ctx, &no_user, &unread_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  DecodePolylineRequest decode;
  decode.set_polyline("!!!invalid!!!");
  DecodePolylineResponse decode_resp;
  assert(server.DecodePolyline(&grpc_ctx, &decode, &decode_resp).ok());
}

} // namespace

int main() {
  TestActiveEventOnRouteIsAffecting();
  TestExpiredEventIsNotReturned();
  TestBoundingBoxExcludesEventOutsideIt();
  TestInvalidPolylineDegradesToWarning();
  TestReingestUpdatesInPlace();
  TestUnreadAndAcknowledge();
  TestRouteTimingInputsAreValidated();
  TestServerTranslatesErrors();

  std::cout << "impact_engine_unit_impact_service: pass\n";
  return 0;
}
