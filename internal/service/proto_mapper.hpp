#pragma once

#include <optional>
#include <vector>

#include "impact/v1.hpp"
#include "internal/engine/route_evaluator.hpp"
#include "internal/geo/geojson.hpp"
#include "internal/model/event.hpp"
#include "internal/notify/notification_targeting.hpp"

namespace impact::service {

/*
  Wire <-> domain conversion. Everything that arrives from a client passes
  through here; shape errors throw util::ValidationError.
*/

impact::v1::Event ToProto(const model::Event& event);

// Validates and normalizes an ingested event: geometry parsed (points
// buffered), bbox derived, window checked, raw metadata kept as JSON.
model::Event EventFromProto(const impact::v1::Event& event, const geo::GeoJsonOptions& options);

impact::v1::LatLng ToProto(const geo::LatLng& point);
geo::LatLng        FromProto(const impact::v1::LatLng& point);

geo::BoundingBox FromProto(const impact::v1::BoundingBox& box);

geo::PolylineFormat FromProto(impact::v1::PolylineFormat format);

std::vector<model::SourceType> SourceTypesFromProto(const google::protobuf::RepeatedField<int>& types);

std::vector<engine::RouteInput> RouteInputsFromProto(const google::protobuf::RepeatedPtrField<impact::v1::RouteInput>& routes);

impact::v1::RouteStatus ToProto(engine::RouteStatus status);

impact::v1::AffectingEvent ToProto(const notify::EventView& view);

} // namespace impact::service
