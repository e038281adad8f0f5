#include "proto_mapper.hpp"

#include <cmath>
#include <string>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace impact::service {

using namespace impact::v1;

namespace {

std::string MetadataToJson(const google::protobuf::Struct& metadata) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(metadata, &out);
  if (!status.ok()) {
    throw util::ValidationError("raw_metadata: " + std::string(status.message()));
  }
  return out;
}

google::protobuf::Struct MetadataFromJson(const std::string& json) {
  google::protobuf::Struct out;
  if (json.empty()) {
    return out;
  }
  // Stored text was produced by MessageToJsonString; a failure leaves the
  // field empty rather than failing the read.
  if (!google::protobuf::util::JsonStringToMessage(json, &out).ok()) {
    out.Clear();
  }
  return out;
}

} // namespace

Event ToProto(const model::Event& e) {
  Event out;
  out.set_id(e.id);
  out.set_source_type(static_cast<SourceType>(e.source_type));
  out.set_geometry_geojson(geo::ToGeoJson(e.geometry));
  *out.mutable_validity_window()->mutable_start()   = util::ToProto(e.start);
  *out.mutable_validity_window()->mutable_expires() = util::ToProto(e.expires);

  out.set_severity(e.severity);
  out.set_certainty(e.certainty);
  out.set_urgency(e.urgency);
  out.set_description(e.description);
  out.set_headline(e.headline);
  if (e.directionality) {
    out.set_directionality(*e.directionality);
  }

  out.set_version(e.version);
  out.set_reroute_hint(e.reroute_hint);
  *out.mutable_raw_metadata() = MetadataFromJson(e.raw_metadata_json);
  return out;
}

model::Event EventFromProto(const Event& in, const geo::GeoJsonOptions& options) {
  if (in.id().empty()) {
    throw util::ValidationError("event id is required");
  }

  const auto prefix = "event " + in.id() + ": ";

  model::Event e;
  e.id = in.id();

  if (in.source_type() == SOURCE_TYPE_UNSPECIFIED || !SourceType_IsValid(in.source_type())) {
    throw util::ValidationError(prefix + "source_type is required");
  }
  e.source_type = static_cast<model::SourceType>(in.source_type());

  try {
    e.geometry = geo::ParseGeoJson(in.geometry_geojson(), options);
  } catch (const util::ValidationError& ex) {
    throw util::ValidationError(prefix + ex.what());
  }
  e.bbox = geo::BoundsOf(e.geometry);

  if (!in.has_validity_window() || !in.validity_window().has_start() || !in.validity_window().has_expires()) {
    throw util::ValidationError(prefix + "validity_window start and expires are required");
  }
  try {
    e.start   = util::FromProto(in.validity_window().start());
    e.expires = util::FromProto(in.validity_window().expires());
  } catch (const util::ValidationError& ex) {
    throw util::ValidationError(prefix + "validity_window " + ex.what());
  }
  if (e.start > e.expires) {
    throw util::ValidationError(prefix + "validity_window start is after expires");
  }

  e.severity    = in.severity();
  e.certainty   = in.certainty();
  e.urgency     = in.urgency();
  e.description = in.description();
  e.headline    = in.headline();

  if (!in.directionality().empty()) {
    if (!geo::ParseDirection(in.directionality())) {
      throw util::ValidationError(prefix + "unknown directionality '" + in.directionality() + "'");
    }
    e.directionality = in.directionality();
  }

  e.reroute_hint      = in.reroute_hint();
  e.raw_metadata_json = in.has_raw_metadata() ? MetadataToJson(in.raw_metadata()) : "{}";
  return e;
}

LatLng ToProto(const geo::LatLng& p) {
  LatLng out;
  out.set_lat(p.lat);
  out.set_lon(p.lon);
  return out;
}

geo::LatLng FromProto(const LatLng& p) {
  return {p.lat(), p.lon()};
}

geo::BoundingBox FromProto(const BoundingBox& box) {
  return {box.min_lon(), box.min_lat(), box.max_lon(), box.max_lat()};
}

geo::PolylineFormat FromProto(PolylineFormat format) {
  return format == POLYLINE_FORMAT_HERE ? geo::PolylineFormat::kHere : geo::PolylineFormat::kGoogle;
}

std::vector<model::SourceType> SourceTypesFromProto(const google::protobuf::RepeatedField<int>& types) {
  std::vector<model::SourceType> out;
  for (int type : types) {
    if (type == SOURCE_TYPE_UNSPECIFIED || !SourceType_IsValid(type)) {
      throw util::ValidationError("unknown source type " + std::to_string(type));
    }
    out.push_back(static_cast<model::SourceType>(type));
  }
  return out;
}

std::vector<engine::RouteInput> RouteInputsFromProto(const google::protobuf::RepeatedPtrField<RouteInput>& routes) {
  std::vector<engine::RouteInput> out;
  out.reserve(routes.size());
  for (const auto& route : routes) {
    if (!std::isfinite(route.average_speed_kph()) || route.average_speed_kph() < 0.0) {
      throw util::ValidationError("route " + route.id() + ": average_speed_kph must be a non-negative number");
    }
    double previous_offset = 0.0;
    for (const double offset : route.vertex_offsets_sec()) {
      if (!std::isfinite(offset) || offset < previous_offset) {
        throw util::ValidationError("route " + route.id() + ": vertex_offsets_sec must be finite, non-negative and non-decreasing");
      }
      previous_offset = offset;
    }
    engine::RouteInput input;
    input.id                = route.id();
    input.polyline          = route.polyline();
    input.format            = FromProto(route.format());
    input.average_speed_kph = route.average_speed_kph();
    input.vertex_offsets_sec.assign(route.vertex_offsets_sec().begin(), route.vertex_offsets_sec().end());
    out.push_back(std::move(input));
  }
  return out;
}

RouteStatus ToProto(engine::RouteStatus status) {
  switch (status) {
    case engine::RouteStatus::kOk:
      return ROUTE_STATUS_OK;
    case engine::RouteStatus::kDecodeFailed:
      return ROUTE_STATUS_DECODE_FAILED;
    case engine::RouteStatus::kTimedOut:
      return ROUTE_STATUS_TIMED_OUT;
    case engine::RouteStatus::kFailed:
      return ROUTE_STATUS_FAILED;
  }
  return ROUTE_STATUS_UNSPECIFIED;
}

AffectingEvent ToProto(const notify::EventView& view) {
  AffectingEvent out;
  *out.mutable_event() = ToProto(*view.event);
  out.set_is_affected(true);
  out.set_read(view.read);
  out.set_newly_delivered(view.newly_delivered);
  *out.mutable_eta() = util::ToProto(view.eta);
  return out;
}

} // namespace impact::service
