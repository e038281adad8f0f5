#include "notification_targeting.hpp"

#include <algorithm>
#include <exception>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/model/notification_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace impact::notify {

namespace {

bool IsRetryable(db::ErrorCode code) {
  return code == db::ErrorCode::Conflict || code == db::ErrorCode::Busy || code == db::ErrorCode::SerializationFailure;
}

// Write results that lost a race become TransactionConflict so the retry loop
// picks them up; anything else is a store failure.
void ThrowOnWriteError(const db::Result& result, std::string_view op) {
  if (result) {
    return;
  }
  const auto message = std::string(op) + ": " + std::string(db::ToString(result.code)) + " " + result.message;
  if (IsRetryable(result.code)) {
    throw util::TransactionConflict(message);
  }
  throw util::ServiceUnavailable(message);
}

void RequireUser(const std::string& user_id) {
  if (user_id.empty()) {
    throw util::ValidationError("user_id is required");
  }
}

} // namespace

NotificationTargeting::NotificationTargeting(std::shared_ptr<db::Repository> repository, std::shared_ptr<const store::EventStoreGateway> gateway,
                                             std::shared_ptr<const engine::RouteEvaluator> evaluator, std::shared_ptr<NotificationSink> sink,
                                             TargetingOptions options)
    : repository_(std::move(repository)),
      gateway_(std::move(gateway)),
      evaluator_(std::move(evaluator)),
      sink_(std::move(sink)),
      options_(std::move(options)) {
  if (!options_.clock) {
    options_.clock = util::Now;
  }
  options_.write_attempts = std::max(options_.write_attempts, 1);
}

/*
  Runs fn(tx) and commits, retrying on TransactionConflict. Store errors
  other than a lost race are reported once as ServiceUnavailable.
*/
template <typename Fn>
auto NotificationTargeting::WithWriteRetry(std::string_view op, Fn&& fn) {
  for (int attempt = 1;; ++attempt) {
    try {
      auto tx     = repository_->Begin();
      auto result = fn(*tx);
      tx->Commit();
      return result;
    } catch (const util::TransactionConflict& e) {
      if (attempt >= options_.write_attempts) {
        IMPACT_LOG_ERROR("state write kept conflicting", {observability::StringField("op", op), observability::IntField("attempts", attempt)});
        throw;
      }
      IMPACT_LOG_WARN("state write conflict, retrying", {observability::StringField("op", op), observability::StringField("error", e.what())});
    } catch (const util::ServiceUnavailable&) {
      throw;
    } catch (const util::ValidationError&) {
      throw;
    } catch (const std::exception& e) {
      IMPACT_LOG_WARN("state store write failed", {observability::StringField("op", op), observability::StringField("error", e.what())});
      throw util::ServiceUnavailable(std::string("state store unavailable: ") + e.what());
    }
  }
}

std::vector<engine::RouteEvaluation> NotificationTargeting::EvaluateRoutes(const std::vector<engine::RouteInput>& routes,
                                                                           const std::vector<model::SourceType>& types, util::TimePoint now,
                                                                           util::TimePoint departure, std::chrono::milliseconds deadline,
                                                                           const std::function<bool()>& is_cancelled) const {
  auto cancel      = engine::CancellationToken::WithTimeout(deadline, is_cancelled);
  auto evaluations = evaluator_->Decode(routes, cancel);

  store::EventSnapshot candidates;
  if (auto bounds = engine::RouteEvaluator::UnionBounds(evaluations)) {
    // Window covers anything the traveller could still meet: from now until
    // lookahead past the later of now and departure.
    store::BoxQuery query;
    query.box       = *bounds;
    query.as_of     = now;
    query.lookahead = std::chrono::duration_cast<std::chrono::milliseconds>(std::max(departure, now) + options_.lookahead - now);
    query.types     = types;
    candidates      = gateway_->QueryByBoundingBox(query);
  }

  evaluator_->Evaluate(evaluations, candidates, departure, cancel);
  return evaluations;
}

NotificationTargeting::DeliveryState NotificationTargeting::RecordDelivery(const std::string& user_id, const model::Event& event, util::TimePoint now) {
  // No delivery record is ever created for an expired event.
  if (event.IsExpiredAt(now)) {
    return {};
  }

  const auto now_ms = util::ToUnixMillis(now);
  auto state = WithWriteRetry("record_delivery", [&](db::Transaction& tx) {
    if (auto existing = repository_->GetUserEventState(tx, user_id, event.id)) {
      return DeliveryState{existing->read, false};
    }

    db::model::UserEventStateRecord record;
    record.user_id          = user_id;
    record.event_id         = event.id;
    record.delivered_at_ms  = now_ms;
    record.read             = false;
    record.event_expires_ms = util::ToUnixMillis(event.expires);

    auto result = repository_->InsertUserEventStateIfAbsent(tx, record);
    if (result.code == db::ErrorCode::AlreadyExists) {
      // Another request delivered it between our read and insert.
      auto winner = repository_->GetUserEventState(tx, user_id, event.id);
      return DeliveryState{winner && winner->read, false};
    }
    ThrowOnWriteError(result, "insert_user_event_state");
    return DeliveryState{false, true};
  });

  if (state.newly_delivered) {
    try {
      sink_->Deliver(user_id, event);
    } catch (const std::exception& e) {
      // The state row is committed; the sink owns its own redelivery.
      IMPACT_LOG_ERROR("notification sink failed",
                       {observability::StringField("user_id", user_id), observability::StringField("event_id", event.id),
                        observability::StringField("error", e.what())});
    }
  }
  return state;
}

std::vector<RouteResult> NotificationTargeting::AffectingEvents(const AffectingRequest& request) {
  const auto now       = options_.clock();
  const auto departure = request.departure.value_or(now);
  const auto deadline  = request.deadline.value_or(options_.request_deadline);

  auto evaluations = EvaluateRoutes(request.routes, request.types, now, departure, deadline, request.is_cancelled);

  // One event can affect several routes; it is delivered once per request.
  std::unordered_map<std::string, DeliveryState> delivered;
  uint64_t                                       new_deliveries = 0;

  std::vector<RouteResult> out;
  out.reserve(evaluations.size());
  for (auto& evaluation : evaluations) {
    RouteResult result;
    result.route_id      = evaluation.route.id;
    result.status        = evaluation.status;
    result.error_message = std::move(evaluation.error_message);
    result.truncated     = evaluation.route.truncated;
    result.vertex_count  = evaluation.route.points.size();

    for (const auto& match : evaluation.affecting) {
      EventView view;
      view.event = match.event;
      view.eta   = match.eta;

      if (!request.user_id.empty()) {
        auto it = delivered.find(match.event->id);
        if (it == delivered.end()) {
          auto state = RecordDelivery(request.user_id, *match.event, now);
          if (state.newly_delivered) {
            ++new_deliveries;
          }
          it = delivered.emplace(match.event->id, state).first;
          view.newly_delivered = state.newly_delivered;
        }
        view.read = it->second.read;
      }
      result.events.push_back(std::move(view));
    }
    out.push_back(std::move(result));
  }

  if (new_deliveries > 0) {
    observability::Metrics::Instance().RecordDeliveries(new_deliveries);
  }
  return out;
}

std::vector<EventView> NotificationTargeting::UnreadEvents(const UnreadRequest& request) {
  RequireUser(request.user_id);
  if (request.location && !geo::IsValidCoordinate(*request.location)) {
    throw util::ValidationError("location out of range");
  }

  const auto now = options_.clock();

  std::vector<EventView>          out;
  std::unordered_set<std::string> seen;
  uint64_t                        new_deliveries = 0;

  auto consider = [&](const store::EventPtr& event, util::TimePoint eta) {
    if (!seen.insert(event->id).second) {
      return;
    }
    auto state = RecordDelivery(request.user_id, *event, now);
    if (state.newly_delivered) {
      ++new_deliveries;
    }
    if (!state.read && !event->IsExpiredAt(now)) {
      out.push_back({event, eta, false, state.newly_delivered});
    }
  };

  if (!request.routes.empty()) {
    const auto departure   = request.departure.value_or(now);
    auto       evaluations = EvaluateRoutes(request.routes, {}, now, departure, options_.request_deadline, request.is_cancelled);
    for (const auto& evaluation : evaluations) {
      for (const auto& match : evaluation.affecting) {
        consider(match.event, match.eta);
      }
    }
  }

  if (request.location) {
    store::BoxQuery query;
    query.box   = geo::BoundingBox::Of(*request.location);
    query.as_of = now;
    for (const auto& event : gateway_->QueryByBoundingBox(query)) {
      if (geo::MultiPolygonContains(event->geometry, *request.location)) {
        consider(event, now);
      }
    }
  }

  if (request.routes.empty() && !request.location) {
    auto states = WithWriteRetry("list_unread", [&](db::Transaction& tx) { return repository_->ListUserEventStates(tx, request.user_id, true); });

    std::vector<std::string> ids;
    ids.reserve(states.size());
    for (const auto& state : states) {
      ids.push_back(state.event_id);
    }

    // Keep the delivery order of the state rows.
    std::unordered_map<std::string, store::EventPtr> by_id;
    for (auto& event : gateway_->GetByIds(ids)) {
      by_id.emplace(event->id, std::move(event));
    }
    for (const auto& id : ids) {
      auto it = by_id.find(id);
      if (it == by_id.end() || it->second->IsExpiredAt(now)) {
        continue;
      }
      out.push_back({it->second, std::max(now, it->second->start), false, false});
    }
  }

  if (new_deliveries > 0) {
    observability::Metrics::Instance().RecordDeliveries(new_deliveries);
  }
  return out;
}

PollResult NotificationTargeting::Poll(uint64_t since_version, const geo::BoundingBox& box) {
  geo::ValidateBoundingBox(box);
  const auto now = options_.clock();

  PollResult result;
  result.version = since_version;

  if (since_version == 0) {
    // Read the cursor first: anything written after it is picked up by the
    // next poll, even if it also shows up in this snapshot.
    const auto cursor = gateway_->CurrentVersion();

    store::BoxQuery query;
    query.box   = box;
    query.as_of = now;
    for (auto& event : gateway_->QueryByBoundingBox(query)) {
      result.events.push_back({std::move(event), true});
    }
    result.version = cursor;
    return result;
  }

  auto page = gateway_->QueryByVersion(since_version, options_.poll_page_limit);
  for (auto& event : page.events) {
    if (!event->bbox.Overlaps(box)) {
      continue;
    }
    const bool affected = !event->IsExpiredAt(now);
    result.events.push_back({std::move(event), affected});
  }
  result.version  = std::max(since_version, page.next_version);
  result.has_more = page.has_more;
  return result;
}

std::vector<AcknowledgeOutcome> NotificationTargeting::Acknowledge(const std::string& user_id, const std::vector<std::string>& event_ids) {
  RequireUser(user_id);

  const auto now    = options_.clock();
  const auto now_ms = util::ToUnixMillis(now);

  std::vector<AcknowledgeOutcome> out;
  out.reserve(event_ids.size());
  for (const auto& event_id : event_ids) {
    AcknowledgeOutcome outcome;
    outcome.event_id = event_id;

    outcome.error = WithWriteRetry("acknowledge", [&](db::Transaction& tx) -> std::string {
      auto state = repository_->GetUserEventState(tx, user_id, event_id);
      if (!state) {
        return "not found";
      }

      const auto current = model::StoredState(state->read, state->event_expires_ms < now_ms);
      if (!model::CanTransition(current, model::NotificationState::kRead)) {
        return "event expired";
      }
      if (state->read) {
        return {};
      }

      auto result = repository_->MarkUserEventStateRead(tx, user_id, event_id, now_ms);
      if (result.code == db::ErrorCode::NotFound) {
        return "not found";
      }
      ThrowOnWriteError(result, "mark_user_event_state_read");
      return {};
    });
    outcome.ok = outcome.error.empty();
    out.push_back(std::move(outcome));
  }
  return out;
}

uint64_t NotificationTargeting::PurgeExpired(util::TimePoint now) {
  const auto deleted = WithWriteRetry("purge_expired", [&](db::Transaction& tx) {
    uint64_t count = 0;
    ThrowOnWriteError(repository_->DeleteExpiredUserEventStates(tx, util::ToUnixMillis(now), count), "delete_expired_user_event_states");
    return count;
  });

  IMPACT_LOG_INFO("purged expired notification state", {observability::IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

} // namespace impact::notify
