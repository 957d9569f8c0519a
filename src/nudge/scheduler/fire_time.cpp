#include "nudge/scheduler/fire_time.hpp"

#include <algorithm>

namespace nudge {

auto no_fire_reason_name(NoFireReason reason) noexcept -> std::string_view {
  switch (reason) {
    case NoFireReason::NotificationsDisabled: return "notifications disabled";
    case NoFireReason::PriorityNotEnabled: return "priority not enabled";
    case NoFireReason::TaskClosed: return "task completed";
    case NoFireReason::WindowElapsed: return "reminder window elapsed";
  }
  return "unknown";
}

auto reminder_lead(const NotificationSettings& settings)
    -> std::chrono::hours {
  return std::chrono::hours(std::clamp(settings.reminder_lead_hours,
                                       limits::kMinLeadHours,
                                       limits::kMaxLeadHours));
}

auto resolve_fire_time(const Task& task, const NotificationSettings& settings,
                       TimePoint now) -> FireDecision {
  if (!settings.enabled)
    return NoFire{NoFireReason::NotificationsDisabled};
  if (!settings.priorities.contains(task.priority))
    return NoFire{NoFireReason::PriorityNotEnabled};
  if (task.status == TaskStatus::Completed)
    return NoFire{NoFireReason::TaskClosed};

  auto fire_at = task.due_at - reminder_lead(settings);
  if (fire_at <= now)
    return NoFire{NoFireReason::WindowElapsed};
  return FireAt{fire_at};
}

}  // namespace nudge
