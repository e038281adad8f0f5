#include "route_evaluator.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "internal/engine/worker_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace impact::engine {

std::string_view ToString(RouteStatus status) {
  switch (status) {
    case RouteStatus::kOk:
      return "ok";
    case RouteStatus::kDecodeFailed:
      return "decode_failed";
    case RouteStatus::kTimedOut:
      return "timed_out";
    case RouteStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

RouteEvaluator::RouteEvaluator(std::shared_ptr<const geo::PolylineCodec> codec, std::shared_ptr<const IntersectionEngine> intersections,
                               std::shared_ptr<const EtaValidator> validator, EvaluatorOptions options)
    : codec_(std::move(codec)),
      intersections_(std::move(intersections)),
      validator_(std::move(validator)),
      max_workers_(ResolveWorkerCount(options.max_workers)) {
}

std::vector<RouteEvaluation> RouteEvaluator::Decode(const std::vector<RouteInput>& inputs, const CancellationToken& cancel) const {
  std::vector<RouteEvaluation> out(inputs.size());

  ParallelFor(inputs.size(), max_workers_, [&](std::size_t i) {
    const auto& input = inputs[i];
    auto&       route = out[i];

    route.route.id                 = input.id;
    route.route.average_speed_kph  = input.average_speed_kph;
    route.route.vertex_offsets_sec = input.vertex_offsets_sec;

    if (cancel.IsCancelled()) {
      route.status        = RouteStatus::kTimedOut;
      route.error_message = "deadline exceeded before decode";
      return;
    }

    auto decoded = codec_->Decode(input.polyline, input.format);
    if (!decoded) {
      const auto& error   = *decoded.error;
      route.status        = RouteStatus::kDecodeFailed;
      route.error_message = std::string(geo::ToString(error.kind)) + " at " + std::to_string(error.position) + ": " + error.message;
      IMPACT_LOG_WARN("route polyline could not be decoded",
                      {observability::StringField("route_id", input.id), observability::StringField("kind", geo::ToString(error.kind)),
                       observability::IntField("position", static_cast<int64_t>(error.position))});
      return;
    }

    route.route.points = std::move(decoded.coordinates);
    intersections_->Truncate(route.route);
  });

  return out;
}

void RouteEvaluator::Evaluate(std::vector<RouteEvaluation>& routes, const store::EventSnapshot& candidates, util::TimePoint departure,
                              const CancellationToken& cancel) const {
  ParallelFor(routes.size(), max_workers_, [&](std::size_t i) {
    auto&      route   = routes[i];
    const auto started = std::chrono::steady_clock::now();

    if (route.status == RouteStatus::kOk) {
      EvaluateOne(route, candidates, departure, cancel);
    }

    const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    observability::Metrics::Instance().ObserveRouteEvaluationMs(elapsed_ms);
    observability::Metrics::Instance().RecordRouteStatus(ToString(route.status));
  });
}

void RouteEvaluator::EvaluateOne(RouteEvaluation& route, const store::EventSnapshot& candidates, util::TimePoint departure,
                                 const CancellationToken& cancel) const {
  if (cancel.IsCancelled()) {
    route.status        = RouteStatus::kTimedOut;
    route.error_message = "deadline exceeded before evaluation";
    return;
  }

  try {
    const auto intersections = intersections_->Intersect(route.route, candidates, cancel);
    if (intersections.empty()) {
      return;
    }

    const auto cumulative = CumulativeDistances(route.route.points);
    for (const auto& intersection : intersections) {
      if (cancel.IsCancelled()) {
        throw util::DeadlineExceeded("route " + route.route.id + " cancelled during validation");
      }
      auto verdict = validator_->Validate(route.route, cumulative, intersection, departure);
      if (verdict.is_affecting) {
        route.affecting.push_back({intersection.event, verdict.eta});
      }
    }
  } catch (const util::DeadlineExceeded& e) {
    route.affecting.clear();
    route.status        = RouteStatus::kTimedOut;
    route.error_message = e.what();
  } catch (const std::exception& e) {
    route.affecting.clear();
    route.status        = RouteStatus::kFailed;
    route.error_message = e.what();
    IMPACT_LOG_ERROR("route evaluation failed", {observability::StringField("route_id", route.route.id), observability::StringField("error", e.what())});
  }
}

std::optional<geo::BoundingBox> RouteEvaluator::UnionBounds(const std::vector<RouteEvaluation>& routes) {
  std::optional<geo::BoundingBox> bounds;
  for (const auto& route : routes) {
    if (route.status != RouteStatus::kOk || route.route.points.empty()) {
      continue;
    }
    const auto box = geo::BoundsOf(route.route.points);
    if (bounds) {
      bounds->Extend(box);
    } else {
      bounds = box;
    }
  }
  return bounds;
}

} // namespace impact::engine
