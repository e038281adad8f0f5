#pragma once

#include <memory>

#include "internal/geo/geojson.hpp"
#include "internal/util/time.hpp"

namespace impact::db { class Repository; }
namespace impact::geo { class PolylineCodec; }
namespace impact::store { class EventStoreGateway; }
namespace impact::notify { class NotificationTargeting; }

namespace impact::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<impact::db::Repository> repository;
  std::shared_ptr<impact::store::EventStoreGateway> gateway;
  std::shared_ptr<impact::geo::PolylineCodec> codec;
  std::shared_ptr<impact::notify::NotificationTargeting> targeting;

  impact::geo::GeoJsonOptions geojson;
  impact::util::ClockFn clock = impact::util::Now;
};

}
