#pragma once

#include "internal/db/model/event_record.hpp"
#include "internal/geo/geojson.hpp"
#include "internal/model/event.hpp"

namespace impact::store {

// Throws util::ValidationError if the stored geometry no longer parses.
model::Event ToDomain(const db::model::EventRecord& record);

db::model::EventRecord ToRecord(const model::Event& event);

} // namespace impact::store
