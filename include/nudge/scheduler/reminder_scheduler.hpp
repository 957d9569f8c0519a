#pragma once

#include "nudge/config/system_config.hpp"
#include "nudge/notify/emitter.hpp"
#include "nudge/scheduler/job_registry.hpp"
#include "nudge/scheduler/timer.hpp"
#include "nudge/storage/store.hpp"
#include "nudge/sweep/digest_sweep.hpp"
#include "nudge/sweep/overdue_sweep.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace nudge {

// Keeps the timer state of every task reminder and of the two recurring
// sweeps in line with what storage says. The only writer of the registry.
class ReminderScheduler {
public:
  ReminderScheduler(Store& store, Timer& timer, NotificationEmitter& emitter,
                    SweepConfig config = {});

  ReminderScheduler(const ReminderScheduler&) = delete;
  auto operator=(const ReminderScheduler&) -> ReminderScheduler& = delete;

  // Re-derives the reminder of `id` from storage. Returns the fire time of
  // the job now registered, or nullopt when nothing is scheduled. A missing
  // task or owner counts as nothing to schedule.
  auto schedule_or_reschedule(const TaskId& id) -> std::optional<TimePoint>;

  // Idempotent.
  auto cancel(const TaskId& id) -> bool;

  // Runs schedule_or_reschedule() for every task of `user`; returns how many
  // reminders ended up scheduled.
  auto reconcile_for_user(const UserId& user) -> std::size_t;

  // Startup pass over every pending task.
  auto reconcile_all() -> std::size_t;

  [[nodiscard]] auto start_recurring_sweeps() -> Result<void>;
  auto stop_recurring_sweeps() -> void;

  // Cancels every job, reminders and sweeps alike.
  auto cancel_all() -> void;

  auto run_overdue_sweep(TimePoint now) -> SweepReport;
  auto run_digest_sweep(TimePoint now) -> SweepReport;

  // Registry key of a task's reminder. Task keys carry a prefix so no task
  // id can name a sweep's slot.
  [[nodiscard]] static auto job_key(const TaskId& id) -> std::string;

  // The reminder currently registered for `id`, if any.
  [[nodiscard]] auto job(const TaskId& id) const -> std::optional<JobEntry>;

  [[nodiscard]] auto registry() noexcept -> JobRegistry& { return registry_; }
  [[nodiscard]] auto registry() const noexcept -> const JobRegistry& {
    return registry_;
  }

private:
  auto fire_reminder(const TaskId& id, TimerHandle handle, int lead_hours)
      -> void;

  Store& store_;
  Timer& timer_;
  NotificationEmitter& emitter_;
  SweepConfig config_;
  JobRegistry registry_;
  OverdueSweep overdue_;
  DigestSweep digest_;
};

[[nodiscard]] auto reminder_message(const Task& task, int lead_hours)
    -> std::string;

}  // namespace nudge
