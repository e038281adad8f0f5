#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/geo/geometry.hpp"
#include "internal/model/event.hpp"
#include "internal/util/time.hpp"

namespace impact::db {
class Repository;
}

namespace impact::store {

using EventPtr      = std::shared_ptr<const model::Event>;
using EventSnapshot = std::vector<EventPtr>;

struct BoxQuery {
  geo::BoundingBox box;
  util::TimePoint  as_of{};

  // Zero: the event must be active at as_of. Otherwise its window must
  // overlap [as_of, as_of + lookahead].
  std::chrono::milliseconds lookahead{0};

  // Empty = all types.
  std::vector<model::SourceType> types;
};

struct VersionPage {
  EventSnapshot events;

  // Version of the last returned event; the request cursor when empty.
  uint64_t next_version = 0;
  bool     has_more     = false;
};

/*
  Read-only query surface over the event collection.

  - Bounds are validated before the store is touched (util::ValidationError).
  - One attempt per call; store failures surface as util::ServiceUnavailable.
  - The bbox filter is coarse; exact geometry tests happen in the engine.
*/
class EventStoreGateway {
 public:
  explicit EventStoreGateway(std::shared_ptr<db::Repository> repository);

  EventSnapshot QueryByBoundingBox(const BoxQuery& query) const;

  // Events with version > since_version, ascending. Never returns one at or
  // below the cursor.
  VersionPage QueryByVersion(uint64_t since_version, std::optional<uint64_t> limit = std::nullopt,
                             const std::vector<model::SourceType>& types = {}) const;

  uint64_t CurrentVersion() const;

  // Missing ids are skipped.
  EventSnapshot GetByIds(const std::vector<std::string>& ids) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace impact::store
