#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/engine/route_evaluator.hpp"
#include "internal/notify/notification_sink.hpp"
#include "internal/store/event_store_gateway.hpp"
#include "internal/util/time.hpp"

namespace impact::db {
class Repository;
}

namespace impact::notify {

struct TargetingOptions {
  // How far past departure candidate events are fetched.
  std::chrono::milliseconds lookahead{std::chrono::hours(4)};

  std::chrono::milliseconds request_deadline{std::chrono::seconds(10)};

  uint64_t poll_page_limit = 500;

  // Attempts for a state write that lost a concurrent commit.
  int write_attempts = 3;

  util::ClockFn clock = util::Now;
};

struct EventView {
  store::EventPtr event;
  util::TimePoint eta{};
  bool            read            = false;
  bool            newly_delivered = false;
};

struct RouteResult {
  std::string         route_id;
  engine::RouteStatus status = engine::RouteStatus::kOk;
  std::string         error_message;
  bool                truncated    = false;
  std::size_t         vertex_count = 0;

  std::vector<EventView> events;
};

struct AffectingRequest {
  std::string                      user_id; // empty: evaluate only, record nothing
  std::vector<engine::RouteInput>  routes;
  std::vector<model::SourceType>   types;
  std::optional<util::TimePoint>   departure;
  std::optional<std::chrono::milliseconds> deadline;
  std::function<bool()>            is_cancelled;
};

struct UnreadRequest {
  std::string                     user_id;
  std::optional<geo::LatLng>      location;
  std::vector<engine::RouteInput> routes;
  std::optional<util::TimePoint>  departure;
  std::function<bool()>           is_cancelled;
};

struct PolledEvent {
  store::EventPtr event;
  bool            is_affected = false;
};

struct PollResult {
  std::vector<PolledEvent> events;
  uint64_t                 version  = 0;
  bool                     has_more = false;
};

struct AcknowledgeOutcome {
  std::string event_id;
  bool        ok = false;
  std::string error;
};

/*
  Combines route evaluation with per-user delivery state and the version
  cursor. The only component that writes: UserEventState rows are created
  with insert-if-absent, so concurrent requests for one user never deliver
  the same event twice.
*/
class NotificationTargeting {
 public:
  NotificationTargeting(std::shared_ptr<db::Repository> repository, std::shared_ptr<const store::EventStoreGateway> gateway,
                        std::shared_ptr<const engine::RouteEvaluator> evaluator, std::shared_ptr<NotificationSink> sink,
                        TargetingOptions options = {});

  std::vector<RouteResult> AffectingEvents(const AffectingRequest& request);

  // Unread affecting events. Without routes or location: stored unread
  // rows whose event is still active.
  std::vector<EventView> UnreadEvents(const UnreadRequest& request);

  // since_version == 0 is an initial sync of the active events in box.
  PollResult Poll(uint64_t since_version, const geo::BoundingBox& box);

  std::vector<AcknowledgeOutcome> Acknowledge(const std::string& user_id, const std::vector<std::string>& event_ids);

  // Deletes state rows whose event expired before now. Returns the count.
  uint64_t PurgeExpired(util::TimePoint now);

  const TargetingOptions& options() const {
    return options_;
  }

 private:
  struct DeliveryState {
    bool read            = false;
    bool newly_delivered = false;
  };

  std::vector<engine::RouteEvaluation> EvaluateRoutes(const std::vector<engine::RouteInput>& routes, const std::vector<model::SourceType>& types,
                                                      util::TimePoint now, util::TimePoint departure, std::chrono::milliseconds deadline,
                                                      const std::function<bool()>& is_cancelled) const;

  DeliveryState RecordDelivery(const std::string& user_id, const model::Event& event, util::TimePoint now);

  template <typename Fn>
  auto WithWriteRetry(std::string_view op, Fn&& fn);

  std::shared_ptr<db::Repository>               repository_;
  std::shared_ptr<const store::EventStoreGateway> gateway_;
  std::shared_ptr<const engine::RouteEvaluator>   evaluator_;
  std::shared_ptr<NotificationSink>               sink_;
  TargetingOptions                                options_;
};

} // namespace impact::notify
