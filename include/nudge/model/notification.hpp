#pragma once

#include "nudge/util/id.hpp"
#include "nudge/util/util.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace nudge {

enum class NotificationKind : std::uint8_t {
  Reminder,
  Overdue,
  DailyDigest,
};

// Immutable once created, except for `read` which the client flips.
struct Notification {
  NotificationId id;
  UserId owner;
  std::optional<TaskId> task;
  NotificationKind kind{NotificationKind::Reminder};
  std::string message;
  TimePoint created_at{};
  bool sent{false};
  bool read{false};
};

}  // namespace nudge
