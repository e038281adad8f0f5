#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/engine/cancellation.hpp"
#include "internal/engine/eta_validator.hpp"
#include "internal/engine/intersection_engine.hpp"
#include "internal/geo/polyline_codec.hpp"
#include "internal/model/route.hpp"
#include "internal/store/event_store_gateway.hpp"

namespace impact::engine {

struct RouteInput {
  std::string         id;
  std::string         polyline;
  geo::PolylineFormat format            = geo::PolylineFormat::kGoogle;
  double              average_speed_kph = 0.0;
  std::vector<double> vertex_offsets_sec;
};

enum class RouteStatus {
  kOk,
  kDecodeFailed,
  kTimedOut,
  kFailed,
};

std::string_view ToString(RouteStatus status);

struct AffectingMatch {
  store::EventPtr event;
  util::TimePoint eta{};
};

struct RouteEvaluation {
  RouteStatus  status = RouteStatus::kOk;
  std::string  error_message;
  model::Route route;

  std::vector<AffectingMatch> affecting;
};

struct EvaluatorOptions {
  // 0 = hardware concurrency.
  std::size_t max_workers = 0;
};

/*
  Per-request route pipeline: decode -> intersect -> validate.

  Decode() and Evaluate() are split so the caller can fetch one candidate
  snapshot covering every decoded route in between. Routes run on a
  request-scoped pool of min(routes, max_workers) threads; a failure or
  timeout marks only its own route.
*/
class RouteEvaluator {
 public:
  RouteEvaluator(std::shared_ptr<const geo::PolylineCodec> codec, std::shared_ptr<const IntersectionEngine> intersections,
                 std::shared_ptr<const EtaValidator> validator, EvaluatorOptions options = {});

  std::vector<RouteEvaluation> Decode(const std::vector<RouteInput>& inputs, const CancellationToken& cancel) const;

  void Evaluate(std::vector<RouteEvaluation>& routes, const store::EventSnapshot& candidates, util::TimePoint departure,
                const CancellationToken& cancel) const;

  // Bounds of every decoded route; nullopt if none has geometry.
  static std::optional<geo::BoundingBox> UnionBounds(const std::vector<RouteEvaluation>& routes);

  std::size_t max_workers() const {
    return max_workers_;
  }

 private:
  void EvaluateOne(RouteEvaluation& route, const store::EventSnapshot& candidates, util::TimePoint departure,
                   const CancellationToken& cancel) const;

  std::shared_ptr<const geo::PolylineCodec>     codec_;
  std::shared_ptr<const IntersectionEngine>     intersections_;
  std::shared_ptr<const EtaValidator>           validator_;
  std::size_t                                   max_workers_;
};

} // namespace impact::engine
