#pragma once

#include <string>

#include "internal/model/event.hpp"

namespace impact::notify {

/*
  Hand-off point to the delivery service (push/email/SMS live elsewhere).
  Called once per (user, event) on first affecting sighting.
*/
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  virtual void Deliver(const std::string& user_id, const model::Event& event) = 0;
};

class LoggingNotificationSink final : public NotificationSink {
 public:
  void Deliver(const std::string& user_id, const model::Event& event) override;
};

} // namespace impact::notify
