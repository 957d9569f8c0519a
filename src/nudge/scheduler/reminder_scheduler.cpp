#include "nudge/scheduler/reminder_scheduler.hpp"

#include "nudge/model/state_strings.hpp"
#include "nudge/scheduler/fire_time.hpp"
#include "nudge/util/log.hpp"

#include <format>

namespace nudge {

using json = nlohmann::json;

auto reminder_message(const Task& task, int lead_hours) -> std::string {
  return std::format("Task \"{}\" is due in {} hour{}", task.title, lead_hours,
                     lead_hours == 1 ? "" : "s");
}

auto ReminderScheduler::job_key(const TaskId& id) -> std::string {
  return std::format("task:{}", id);
}

ReminderScheduler::ReminderScheduler(Store& store, Timer& timer,
                                     NotificationEmitter& emitter,
                                     SweepConfig config)
    : store_(store),
      timer_(timer),
      emitter_(emitter),
      config_(std::move(config)),
      registry_(timer),
      overdue_(store, emitter, config_.overdue_preview_limit),
      digest_(store, emitter) {
}

auto ReminderScheduler::schedule_or_reschedule(const TaskId& id)
    -> std::optional<TimePoint> {
  auto key = job_key(id);
  auto ticket = registry_.begin(key);

  auto task = store_.get_task(id);
  if (!task) {
    if (!is_error(task.error(), Error::NotFound)) {
      log::warn("Cannot schedule task {}: {}", id, task.error().message());
    }
    registry_.clear(key, ticket);
    return std::nullopt;
  }

  auto owner = store_.get_user(task->owner);
  if (!owner) {
    log::warn("Cannot schedule task {}: owner {}: {}", id, task->owner,
              owner.error().message());
    registry_.clear(key, ticket);
    return std::nullopt;
  }

  auto decision = resolve_fire_time(*task, owner->settings, timer_.now());
  if (const auto* skip = std::get_if<NoFire>(&decision)) {
    log::debug("No reminder for task {}: {}", id,
               no_fire_reason_name(skip->reason));
    registry_.clear(key, ticket);
    return std::nullopt;
  }

  auto when = std::get<FireAt>(decision).when;
  auto lead_hours = static_cast<int>(reminder_lead(owner->settings).count());

  // The handle is registered before the timer is armed, so the firing
  // always finds itself in the registry unless it was superseded.
  auto handle = timer_.reserve();
  if (!registry_.commit(key, ticket, JobEntry{handle, when})) {
    return std::nullopt;
  }
  timer_.arm(handle, when, [this, id, handle, lead_hours] {
    fire_reminder(id, handle, lead_hours);
  });
  log::info("Reminder for task {} scheduled at {}", id, format_timestamp(when));
  return when;
}

auto ReminderScheduler::job(const TaskId& id) const
    -> std::optional<JobEntry> {
  return registry_.find(job_key(id));
}

auto ReminderScheduler::cancel(const TaskId& id) -> bool {
  auto cancelled = registry_.cancel(job_key(id));
  if (cancelled) {
    log::debug("Reminder for task {} cancelled", id);
  }
  return cancelled;
}

auto ReminderScheduler::reconcile_for_user(const UserId& user) -> std::size_t {
  auto tasks = store_.list_tasks(TaskQuery{.owner = user});
  if (!tasks) {
    log::error("Cannot reconcile user {}: {}", user, tasks.error().message());
    return 0;
  }

  std::size_t scheduled = 0;
  for (const auto& task : *tasks) {
    if (schedule_or_reschedule(task.id))
      ++scheduled;
  }
  log::info("Reconciled {} task(s) of user {}, {} reminder(s) scheduled",
            tasks->size(), user, scheduled);
  return scheduled;
}

auto ReminderScheduler::reconcile_all() -> std::size_t {
  auto tasks = store_.list_tasks(TaskQuery{.statuses = {TaskStatus::Pending}});
  if (!tasks) {
    log::error("Startup reconciliation failed: {}", tasks.error().message());
    return 0;
  }

  std::size_t scheduled = 0;
  for (const auto& task : *tasks) {
    if (schedule_or_reschedule(task.id))
      ++scheduled;
  }
  log::info("Startup reconciliation: {} pending task(s), {} reminder(s)",
            tasks->size(), scheduled);
  return scheduled;
}

auto ReminderScheduler::fire_reminder(const TaskId& id, TimerHandle handle,
                                      int lead_hours) -> void {
  // A newer pass or a cancel owns the key now; this firing is stale.
  if (!registry_.release(job_key(id), handle)) {
    log::debug("Stale reminder for task {} dropped", id);
    return;
  }

  auto task = store_.get_task(id);
  if (!task) {
    log::info("Reminder for task {} dropped: {}", id, task.error().message());
    return;
  }
  if (task->status == TaskStatus::Completed) {
    log::debug("Reminder for completed task {} dropped", id);
    return;
  }

  Notification n{.owner = task->owner,
                 .task = task->id,
                 .kind = NotificationKind::Reminder,
                 .message = reminder_message(*task, lead_hours),
                 .created_at = timer_.now()};
  json extra = {{"task",
                 {{"id", task->id.str()},
                  {"title", task->title},
                  {"due_at", format_timestamp(task->due_at)},
                  {"priority", priority_name(task->priority)}}}};
  if (auto r = emitter_.deliver(std::move(n), std::move(extra)); !r) {
    log::warn("Reminder for task {} not delivered: {}", id,
              r.error().message());
    return;
  }
  log::info("Sent reminder for task {}", id);
}

auto ReminderScheduler::start_recurring_sweeps() -> Result<void> {
  auto overdue_cron = CronExpr::parse(config_.overdue_cron);
  if (!overdue_cron)
    return std::unexpected(overdue_cron.error());
  auto digest_cron = CronExpr::parse(config_.digest_cron);
  if (!digest_cron)
    return std::unexpected(digest_cron.error());

  auto now = timer_.now();
  std::chrono::minutes offset{config_.utc_offset_minutes};

  auto overdue = timer_.every(*overdue_cron, [this] {
    run_overdue_sweep(timer_.now());
  });
  registry_.replace(jobs::kOverdueCheck,
                    JobEntry{overdue, overdue_cron->next_after(now, offset)});

  auto digest = timer_.every(*digest_cron, [this] {
    run_digest_sweep(timer_.now());
  });
  registry_.replace(jobs::kDigest,
                    JobEntry{digest, digest_cron->next_after(now, offset)});

  log::info("Recurring sweeps scheduled: overdue '{}', digest '{}'",
            config_.overdue_cron, config_.digest_cron);
  return ok();
}

auto ReminderScheduler::stop_recurring_sweeps() -> void {
  registry_.cancel(jobs::kOverdueCheck);
  registry_.cancel(jobs::kDigest);
}

auto ReminderScheduler::cancel_all() -> void {
  auto count = registry_.size();
  registry_.cancel_all();
  log::info("Cancelled {} scheduled job(s)", count);
}

auto ReminderScheduler::run_overdue_sweep(TimePoint now) -> SweepReport {
  return overdue_.run(now);
}

auto ReminderScheduler::run_digest_sweep(TimePoint now) -> SweepReport {
  return digest_.run(now);
}

}  // namespace nudge
