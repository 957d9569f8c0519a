#pragma once

#include "nudge/config/config.hpp"
#include "nudge/core/error.hpp"
#include "nudge/notify/emitter.hpp"
#include "nudge/notify/event_hub.hpp"
#include "nudge/scheduler/reminder_scheduler.hpp"
#include "nudge/scheduler/timer_loop.hpp"
#include "nudge/storage/persistence.hpp"

#include <atomic>
#include <cstddef>
#include <vector>

namespace nudge {

// Owns storage, the push channel, the timer loop and the scheduler, and
// exposes the task and user mutations that must keep reminders in sync.
class Application {
public:
  explicit Application(Config config = {});
  ~Application();

  Application(const Application&) = delete;
  auto operator=(const Application&) -> Application& = delete;

  // Lifecycle
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }
  // Opens the database without starting timers, for one-off commands.
  [[nodiscard]] auto open_storage() -> Result<void>;

  [[nodiscard]] auto config() const noexcept -> const Config& {
    return config_;
  }

  // Tasks
  [[nodiscard]] auto create_task(Task task) -> Result<Task>;
  [[nodiscard]] auto update_task(Task task) -> Result<Task>;
  [[nodiscard]] auto complete_task(const TaskId& id) -> Result<void>;
  [[nodiscard]] auto delete_task(const TaskId& id) -> Result<void>;

  // Users
  [[nodiscard]] auto save_user(User user) -> Result<User>;
  [[nodiscard]] auto update_notification_settings(
      const UserId& id, const NotificationSettings& settings) -> Result<void>;

  // Notifications
  [[nodiscard]] auto notifications(const UserId& owner)
      -> Result<std::vector<Notification>>;
  [[nodiscard]] auto mark_read(const UserId& owner, const NotificationId& id)
      -> Result<void>;
  [[nodiscard]] auto mark_all_read(const UserId& owner) -> Result<std::size_t>;

  auto run_overdue_sweep() -> SweepReport;
  auto run_digest_sweep() -> SweepReport;

  [[nodiscard]] auto store() noexcept -> Persistence& { return store_; }
  [[nodiscard]] auto hub() noexcept -> EventHub& { return hub_; }
  [[nodiscard]] auto timer() noexcept -> TimerLoop& { return timer_; }
  [[nodiscard]] auto scheduler() noexcept -> ReminderScheduler& {
    return scheduler_;
  }

private:
  std::atomic<bool> running_{false};
  Config config_;

  Persistence store_;
  EventHub hub_;
  TimerLoop timer_;
  NotificationEmitter emitter_;
  ReminderScheduler scheduler_;
};

}  // namespace nudge
