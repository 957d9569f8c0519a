#pragma once

#include "nudge/model/task.hpp"
#include "nudge/model/user.hpp"

#include <cstdint>
#include <string_view>
#include <variant>

namespace nudge {

enum class NoFireReason : std::uint8_t {
  NotificationsDisabled,
  PriorityNotEnabled,
  TaskClosed,
  WindowElapsed,
};

struct NoFire {
  NoFireReason reason;
  friend auto operator==(const NoFire&, const NoFire&) -> bool = default;
};

struct FireAt {
  TimePoint when;
  friend auto operator==(const FireAt&, const FireAt&) -> bool = default;
};

using FireDecision = std::variant<NoFire, FireAt>;

[[nodiscard]] auto no_fire_reason_name(NoFireReason reason) noexcept
    -> std::string_view;

// Lead hours outside [1, 24] are clamped.
[[nodiscard]] auto reminder_lead(const NotificationSettings& settings)
    -> std::chrono::hours;

// Decides whether and when the reminder for `task` fires. Pure: depends only
// on its arguments. A reminder whose window has already opened is skipped,
// never fired late.
[[nodiscard]] auto resolve_fire_time(const Task& task,
                                     const NotificationSettings& settings,
                                     TimePoint now) -> FireDecision;

}  // namespace nudge
