#include "nudge/app/application.hpp"

#include "nudge/util/log.hpp"

namespace nudge {

Application::Application(Config config)
    : config_(std::move(config)),
      store_(config_.storage.db_file),
      timer_(std::chrono::minutes(config_.sweeps.utc_offset_minutes)),
      emitter_(store_, hub_),
      scheduler_(store_, timer_, emitter_, config_.sweeps) {
}

Application::~Application() {
  stop();
}

auto Application::open_storage() -> Result<void> {
  if (store_.is_open())
    return ok();
  if (auto r = store_.open(); !r) {
    log::error("Failed to open database {}: {}", config_.storage.db_file,
               r.error().message());
    return r;
  }
  return ok();
}

auto Application::start() -> Result<void> {
  if (running_.exchange(true))
    return ok();

  if (auto r = open_storage(); !r) {
    running_.store(false);
    return r;
  }

  hub_.start();
  timer_.start();

  if (config_.scheduler.reconcile_on_start) {
    scheduler_.reconcile_all();
  }
  if (auto r = scheduler_.start_recurring_sweeps(); !r) {
    log::error("Failed to schedule sweeps: {}", r.error().message());
    stop();
    return r;
  }

  log::info("nudge started");
  return ok();
}

auto Application::stop() -> void {
  if (!running_.exchange(false))
    return;

  log::info("Stopping nudge...");
  scheduler_.cancel_all();
  timer_.stop();
  hub_.stop();
  store_.close();
  log::info("nudge stopped");
}

auto Application::create_task(Task task) -> Result<Task> {
  if (task.title.empty() || task.owner.empty()) {
    return fail(Error::InvalidArgument);
  }
  if (auto owner = store_.get_user(task.owner); !owner) {
    return std::unexpected(owner.error());
  }

  if (task.id.empty()) {
    task.id = TaskId{generate_uuid()};
  }
  auto now = Clock::now();
  task.status = TaskStatus::Pending;
  task.created_at = now;
  task.updated_at = now;
  task.completed_at.reset();

  if (auto r = store_.save_task(task); !r) {
    return std::unexpected(r.error());
  }
  scheduler_.schedule_or_reschedule(task.id);
  return task;
}

auto Application::update_task(Task task) -> Result<Task> {
  auto current = store_.get_task(task.id);
  if (!current) {
    return std::unexpected(current.error());
  }
  if (task.title.empty()) {
    return fail(Error::InvalidArgument);
  }

  // Ownership and creation time are not editable.
  task.owner = current->owner;
  task.created_at = current->created_at;
  task.updated_at = Clock::now();
  if (task.status == TaskStatus::Completed) {
    if (!task.completed_at)
      task.completed_at = task.updated_at;
  } else {
    task.completed_at.reset();
  }

  if (task.status == TaskStatus::Completed) {
    scheduler_.cancel(task.id);
  }
  if (auto r = store_.save_task(task); !r) {
    return std::unexpected(r.error());
  }
  if (task.status != TaskStatus::Completed) {
    scheduler_.schedule_or_reschedule(task.id);
  }
  return task;
}

auto Application::complete_task(const TaskId& id) -> Result<void> {
  scheduler_.cancel(id);
  auto changed = store_.update_task_status(id, TaskStatus::Completed);
  if (!changed) {
    return std::unexpected(changed.error());
  }
  if (!*changed) {
    return fail(Error::NotFound);
  }
  return ok();
}

auto Application::delete_task(const TaskId& id) -> Result<void> {
  scheduler_.cancel(id);
  return store_.delete_task(id);
}

auto Application::save_user(User user) -> Result<User> {
  if (user.id.empty()) {
    user.id = UserId{generate_uuid()};
  }
  if (auto r = user.settings.validate(); !r) {
    return std::unexpected(r.error());
  }

  auto now = Clock::now();
  auto existing = store_.get_user(user.id);
  user.created_at = existing ? existing->created_at : now;
  user.updated_at = now;

  if (auto r = store_.save_user(user); !r) {
    return std::unexpected(r.error());
  }
  if (existing && existing->settings != user.settings) {
    scheduler_.reconcile_for_user(user.id);
  }
  return user;
}

auto Application::update_notification_settings(
    const UserId& id, const NotificationSettings& settings) -> Result<void> {
  if (auto r = settings.validate(); !r) {
    return r;
  }
  auto user = store_.get_user(id);
  if (!user) {
    return std::unexpected(user.error());
  }

  user->settings = settings;
  user->updated_at = Clock::now();
  if (auto r = store_.save_user(*user); !r) {
    return r;
  }
  scheduler_.reconcile_for_user(id);
  return ok();
}

auto Application::notifications(const UserId& owner)
    -> Result<std::vector<Notification>> {
  return store_.list_notifications(owner);
}

auto Application::mark_read(const UserId& owner, const NotificationId& id)
    -> Result<void> {
  return store_.mark_notification_read(owner, id);
}

auto Application::mark_all_read(const UserId& owner) -> Result<std::size_t> {
  return store_.mark_all_notifications_read(owner);
}

auto Application::run_overdue_sweep() -> SweepReport {
  return scheduler_.run_overdue_sweep(Clock::now());
}

auto Application::run_digest_sweep() -> SweepReport {
  return scheduler_.run_digest_sweep(Clock::now());
}

}  // namespace nudge
