#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <google/protobuf/util/json_util.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/service/impact_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/store/event_store_gateway.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "impact/v1.hpp"

namespace {

using namespace impact::v1;

constexpr const char* kSquare = R"({"type":"Polygon","coordinates":[[[-95.4,29.6],[-95.3,29.6],[-95.3,29.7],[-95.4,29.7],[-95.4,29.6]]]})";

impact::service::ServiceContext BuildContext() {
  return impact::factory::BuildContext(impact::runtime::config::EngineConfig{}, std::make_shared<impact::db::memory::MemoryRepository>());
}

Event ValidEvent(const std::string& id) {
  const auto now = impact::util::Now();

  Event event;
  event.set_id(id);
  event.set_source_type(SOURCE_TYPE_FLOOD);
  event.set_geometry_geojson(kSquare);
  *event.mutable_validity_window()->mutable_start()   = impact::util::ToProto(now - std::chrono::minutes(10));
  *event.mutable_validity_window()->mutable_expires() = impact::util::ToProto(now + std::chrono::hours(2));
  event.set_severity("severe");
  event.set_directionality("eastbound");
  (*event.mutable_raw_metadata()->mutable_fields())["gauge"].set_string_value("BBAT2");
  return event;
}

bool RejectsWithValidation(impact::service::IngestService& ingest, const Event& event) {
  UpsertEventsRequest req;
  *req.add_events() = event;
  try {
    (void)ingest.UpsertEvents(req);
  } catch (const impact::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestValidEventIsNormalized() {
  auto                            ctx = BuildContext();
  impact::service::IngestService  ingest(ctx);

  UpsertEventsRequest req;
  *req.add_events() = ValidEvent("flood-1");
  auto resp         = ingest.UpsertEvents(req);
  assert(resp.results_size() == 1);
  assert(resp.results(0).created());
  assert(resp.results(0).version() > 0);

  auto events = ctx.gateway->GetByIds({"flood-1"});
  assert(events.size() == 1);
  const auto& event = *events[0];
  assert(event.source_type == impact::model::SourceType::kFlood);
  assert(event.bbox.min_lon == -95.4 && event.bbox.max_lat == 29.7);
  assert(event.directionality == std::string("eastbound"));
  assert(event.raw_metadata_json.find("BBAT2") != std::string::npos);
  assert(event.version == resp.results(0).version());
}

void TestInvalidEventsAreRejected() {
  auto                           ctx = BuildContext();
  impact::service::IngestService ingest(ctx);

  auto no_id = ValidEvent("x");
  no_id.clear_id();
  assert(RejectsWithValidation(ingest, no_id));

  auto open_ring = ValidEvent("open");
  open_ring.set_geometry_geojson(R"({"type":"Polygon","coordinates":[[[-95.4,29.6],[-95.3,29.6],[-95.3,29.7],[-95.4,29.7]]]})");
  assert(RejectsWithValidation(ingest, open_ring));

  auto out_of_range = ValidEvent("range");
  out_of_range.set_geometry_geojson(R"({"type":"Polygon","coordinates":[[[-95.4,29.6],[-95.3,95.0],[-95.3,29.7],[-95.4,29.6]]]})");
  assert(RejectsWithValidation(ingest, out_of_range));

  auto inverted = ValidEvent("window");
  std::swap(*inverted.mutable_validity_window()->mutable_start(), *inverted.mutable_validity_window()->mutable_expires());
  assert(RejectsWithValidation(ingest, inverted));

  // Year 9000 is a valid protobuf Timestamp but beyond the engine clock.
  auto far_future = ValidEvent("far");
  far_future.mutable_validity_window()->mutable_expires()->set_seconds(221845392000LL);
  assert(RejectsWithValidation(ingest, far_future));

  auto bad_nanos = ValidEvent("nanos");
  bad_nanos.mutable_validity_window()->mutable_start()->set_nanos(-1);
  assert(RejectsWithValidation(ingest, bad_nanos));

  auto no_window = ValidEvent("nowindow");
  no_window.clear_validity_window();
  assert(RejectsWithValidation(ingest, no_window));

  auto no_type = ValidEvent("notype");
  no_type.set_source_type(SOURCE_TYPE_UNSPECIFIED);
  assert(RejectsWithValidation(ingest, no_type));

  auto bad_direction = ValidEvent("direction");
  bad_direction.set_directionality("upward");
  assert(RejectsWithValidation(ingest, bad_direction));
}

void TestBatchIsAllOrNothing() {
  auto                           ctx = BuildContext();
  impact::service::IngestService ingest(ctx);

  UpsertEventsRequest req;
  *req.add_events() = ValidEvent("good");
  auto bad          = ValidEvent("bad");
  bad.set_geometry_geojson("{}");
  *req.add_events() = bad;

  bool threw = false;
  try {
    (void)ingest.UpsertEvents(req);
  } catch (const impact::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(ctx.gateway->GetByIds({"good"}).empty());
  assert(ctx.gateway->CurrentVersion() == 0);
}

void TestVersionsIncreaseAcrossBatches() {
  auto                           ctx = BuildContext();
  impact::service::IngestService ingest(ctx);

  uint64_t last = 0;
  for (int i = 0; i < 5; ++i) {
    UpsertEventsRequest req;
    *req.add_events() = ValidEvent("e" + std::to_string(i % 2));
    auto resp         = ingest.UpsertEvents(req);
    assert(resp.results(0).version() > last);
    assert(resp.results(0).created() == (i < 2));
    last = resp.results(0).version();
  }
  assert(ctx.gateway->QueryByVersion(0).events.size() == 2);
}

void TestIngestFromJsonFile() {
  auto                           ctx = BuildContext();
  impact::service::IngestService ingest(ctx);

  // Shape accepted by `impactctl ingest`.
  const std::string json = R"({"events":[{"id":"dms-7","sourceType":"SOURCE_TYPE_DMS",
      "geometryGeojson":"{\"type\":\"Point\",\"coordinates\":[-95.36,29.76]}",
      "validityWindow":{"start":"2024-01-01T10:00:00Z","expires":"2099-01-01T00:00:00Z"},
      "headline":"ACCIDENT AHEAD"}]})";

  UpsertEventsRequest req;
  assert(google::protobuf::util::JsonStringToMessage(json, &req).ok());
  auto resp = ingest.UpsertEvents(req);
  assert(resp.results(0).id() == "dms-7");

  auto events = ctx.gateway->GetByIds({"dms-7"});
  assert(events.size() == 1);
  assert(events[0]->geometry.size() == 1);
  assert(impact::geo::MultiPolygonContains(events[0]->geometry, {29.76, -95.36}));
}

void TestPurgeExpired() {
  auto                           ctx = BuildContext();
  impact::service::IngestService ingest(ctx);
  impact::service::ImpactService impact_service(ctx);

  // Location request creates the state row.
  UpsertEventsRequest upsert;
  *upsert.add_events() = ValidEvent("e1");
  (void)ingest.UpsertEvents(upsert);

  GetUnreadEventsRequest unread;
  unread.set_user_id("alice");
  unread.mutable_location()->set_lat(29.65);
  unread.mutable_location()->set_lon(-95.35);
  assert(impact_service.GetUnreadEvents(unread).unread_count() == 1);

  PurgeExpiredRequest purge;
  assert(ingest.PurgeExpired(purge).purged_states() == 0);

  *purge.mutable_now() = impact::util::ToProto(impact::util::Now() + std::chrono::hours(3));
  assert(ingest.PurgeExpired(purge).purged_states() == 1);

  PurgeExpiredRequest far_purge;
  far_purge.mutable_now()->set_seconds(221845392000LL);
  bool rejected = false;
  try {
    (void)ingest.PurgeExpired(far_purge);
  } catch (const impact::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestValidEventIsNormalized();
  TestInvalidEventsAreRejected();
  TestBatchIsAllOrNothing();
  TestVersionsIncreaseAcrossBatches();
  TestIngestFromJsonFile();
  TestPurgeExpired();

  std::cout << "impact_engine_unit_ingest_service: pass\n";
  return 0;
}
