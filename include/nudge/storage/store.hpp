#pragma once

#include "nudge/core/constants.hpp"
#include "nudge/core/error.hpp"
#include "nudge/model/notification.hpp"
#include "nudge/model/task.hpp"
#include "nudge/model/user.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace nudge {

// Filter for list_tasks(). Unset members do not constrain; results are
// ordered by due date, earliest first.
struct TaskQuery {
  std::optional<UserId> owner;
  std::vector<TaskStatus> statuses;
  std::optional<TimePoint> due_before;
};

// Storage gateway consumed by the scheduling engine and the application
// layer. Every call may fail; callers in the engine log and skip.
class Store {
public:
  virtual ~Store() = default;

  [[nodiscard]] virtual auto get_user(const UserId& id) -> Result<User> = 0;
  [[nodiscard]] virtual auto save_user(const User& user) -> Result<void> = 0;
  [[nodiscard]] virtual auto list_users(bool notifications_enabled_only)
      -> Result<std::vector<User>> = 0;

  [[nodiscard]] virtual auto get_task(const TaskId& id) -> Result<Task> = 0;
  [[nodiscard]] virtual auto save_task(const Task& task) -> Result<void> = 0;
  [[nodiscard]] virtual auto delete_task(const TaskId& id) -> Result<void> = 0;
  [[nodiscard]] virtual auto list_tasks(const TaskQuery& query)
      -> Result<std::vector<Task>> = 0;

  // Sets the status of `id` to `to`. With `expected`, only a task currently
  // in that status changes. Returns whether a row changed.
  [[nodiscard]] virtual auto update_task_status(
      const TaskId& id, TaskStatus to,
      std::optional<TaskStatus> expected = std::nullopt) -> Result<bool> = 0;

  [[nodiscard]] virtual auto create_notification(const Notification& n)
      -> Result<void> = 0;
  // Newest first.
  [[nodiscard]] virtual auto list_notifications(
      const UserId& owner, std::size_t limit = limits::kNotificationListLimit)
      -> Result<std::vector<Notification>> = 0;
  [[nodiscard]] virtual auto mark_notification_read(const UserId& owner,
                                                    const NotificationId& id)
      -> Result<void> = 0;
  [[nodiscard]] virtual auto mark_all_notifications_read(const UserId& owner)
      -> Result<std::size_t> = 0;

  // Pending tasks of `owner` due strictly before `as_of`.
  [[nodiscard]] auto find_tasks_overdue_as_of(const UserId& owner,
                                              TimePoint as_of)
      -> Result<std::vector<Task>> {
    return list_tasks(TaskQuery{.owner = owner,
                                .statuses = {TaskStatus::Pending},
                                .due_before = as_of});
  }
};

}  // namespace nudge
