#pragma once

#include "nudge/model/notification.hpp"
#include "nudge/model/task.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace nudge {

namespace detail {

constexpr std::array<std::string_view, 3> kPriorityNames = {
    "low",
    "medium",
    "high",
};

constexpr std::array<std::string_view, 3> kTaskStatusNames = {
    "pending",
    "completed",
    "overdue",
};

constexpr std::array<std::string_view, 3> kNotificationKindNames = {
    "reminder",
    "overdue",
    "daily_digest",
};

template <typename E, std::size_t N>
[[nodiscard]] constexpr auto enum_name(
    const std::array<std::string_view, N>& names, E value) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(value);
  return idx < names.size() ? names[idx] : "unknown";
}

template <typename E, std::size_t N>
[[nodiscard]] constexpr auto enum_parse(
    const std::array<std::string_view, N>& names, std::string_view name) noexcept
    -> std::optional<E> {
  auto it = std::ranges::find(names, name);
  if (it == names.end())
    return std::nullopt;
  return static_cast<E>(std::ranges::distance(names.begin(), it));
}

}  // namespace detail

[[nodiscard]] constexpr auto priority_name(Priority p) noexcept
    -> std::string_view {
  return detail::enum_name(detail::kPriorityNames, p);
}

[[nodiscard]] constexpr auto parse_priority(std::string_view name) noexcept
    -> std::optional<Priority> {
  return detail::enum_parse<Priority>(detail::kPriorityNames, name);
}

[[nodiscard]] constexpr auto task_status_name(TaskStatus s) noexcept
    -> std::string_view {
  return detail::enum_name(detail::kTaskStatusNames, s);
}

[[nodiscard]] constexpr auto parse_task_status(std::string_view name) noexcept
    -> std::optional<TaskStatus> {
  return detail::enum_parse<TaskStatus>(detail::kTaskStatusNames, name);
}

[[nodiscard]] constexpr auto notification_kind_name(NotificationKind k) noexcept
    -> std::string_view {
  return detail::enum_name(detail::kNotificationKindNames, k);
}

[[nodiscard]] constexpr auto parse_notification_kind(
    std::string_view name) noexcept -> std::optional<NotificationKind> {
  return detail::enum_parse<NotificationKind>(detail::kNotificationKindNames,
                                              name);
}

}  // namespace nudge
