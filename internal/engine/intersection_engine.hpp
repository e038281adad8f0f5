#pragma once

#include <cstddef>
#include <vector>

#include "internal/engine/cancellation.hpp"
#include "internal/model/route.hpp"
#include "internal/store/event_store_gateway.hpp"

namespace impact::engine {

struct IntersectionOptions {
  std::size_t max_route_vertices = 5000;

  // Segments tested between cancellation checks.
  std::size_t cancel_check_interval = 256;
};

/*
  Route-vs-polygon intersection.

  A segment matches an event when either endpoint lies inside one of the
  event's polygons (holes excluded) or the segment crosses any ring edge.
  Contiguous matching segments are reported as one inclusive vertex range.

  Pure apart from logging; safe to call from many threads.
*/
class IntersectionEngine {
 public:
  explicit IntersectionEngine(IntersectionOptions options = {});

  // Cuts the route to max_route_vertices. Returns true (and sets
  // route.truncated) when points were dropped.
  bool Truncate(model::Route& route) const;

  // Throws util::DeadlineExceeded if cancel fires mid-way.
  std::vector<model::Intersection> Intersect(const model::Route& route, const store::EventSnapshot& candidates,
                                             const CancellationToken& cancel = {}) const;

  const IntersectionOptions& options() const {
    return options_;
  }

 private:
  std::vector<model::SegmentRange> MatchEvent(const model::Route& route, const model::Event& event, const CancellationToken& cancel,
                                              std::size_t& work) const;

  IntersectionOptions options_;
};

} // namespace impact::engine
