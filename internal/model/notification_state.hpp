#pragma once

#include <cstdint>

namespace impact::model {

/*
  Lifecycle of one (event, user) pair.

  Unseen -> Evaluated -> Affecting | NotAffecting
  Affecting -> Delivered -> Unread | Read
  any live state -> Expired once now > event.expires
*/
enum class NotificationState : std::uint8_t {
  kUnseen       = 0,
  kEvaluated    = 1,
  kAffecting    = 2,
  kNotAffecting = 3,
  kDelivered    = 4,
  kUnread       = 5,
  kRead         = 6,
  kExpired      = 7,
};

constexpr bool IsTerminal(NotificationState state) {
  return state == NotificationState::kExpired;
}

constexpr bool CanTransition(NotificationState from, NotificationState to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == NotificationState::kExpired) {
    return true;
  }

  switch (from) {
    case NotificationState::kUnseen:
      return to == NotificationState::kEvaluated;
    case NotificationState::kEvaluated:
      return to == NotificationState::kAffecting || to == NotificationState::kNotAffecting;
    case NotificationState::kAffecting:
      return to == NotificationState::kDelivered;
    case NotificationState::kNotAffecting:
      // Re-evaluated on the next request.
      return to == NotificationState::kEvaluated;
    case NotificationState::kDelivered:
      return to == NotificationState::kUnread || to == NotificationState::kRead;
    case NotificationState::kUnread:
      return to == NotificationState::kRead;
    case NotificationState::kRead:
    case NotificationState::kExpired:
      return false;
  }
  return false;
}

// Stored row state for a delivered pair.
constexpr NotificationState StoredState(bool read, bool expired) {
  if (expired) {
    return NotificationState::kExpired;
  }
  return read ? NotificationState::kRead : NotificationState::kUnread;
}

} // namespace impact::model
