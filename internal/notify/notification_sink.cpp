#include "notification_sink.hpp"

#include "internal/observability/logging.hpp"

namespace impact::notify {

void LoggingNotificationSink::Deliver(const std::string& user_id, const model::Event& event) {
  IMPACT_LOG_INFO("notification delivered",
                  {observability::StringField("user_id", user_id), observability::StringField("event_id", event.id),
                   observability::StringField("source_type", model::ToString(event.source_type)),
                   observability::StringField("headline", event.headline)});
}

} // namespace impact::notify
