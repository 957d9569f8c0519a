#include "nudge/sweep/overdue_sweep.hpp"

#include "nudge/model/state_strings.hpp"
#include "nudge/util/log.hpp"

#include <exception>
#include <format>
#include <vector>

namespace nudge {

using json = nlohmann::json;

auto overdue_message(std::size_t count) -> std::string {
  return std::format(
      "You have {} overdue task{}. Please review and update their status.",
      count, count == 1 ? "" : "s");
}

OverdueSweep::OverdueSweep(Store& store, NotificationEmitter& emitter,
                           std::size_t preview_limit)
    : store_(store), emitter_(emitter), preview_limit_(preview_limit) {
}

auto OverdueSweep::run(TimePoint now) -> SweepReport {
  SweepReport report;
  RunGuard guard(running_);
  if (!guard.acquired()) {
    log::warn("Overdue sweep still running, skipping this run");
    report.skipped = true;
    return report;
  }

  auto users = store_.list_users(true);
  if (!users) {
    log::error("Overdue sweep: failed to list users: {}",
               users.error().message());
    return report;
  }

  for (const auto& user : *users) {
    ++report.users_scanned;
    try {
      if (auto r = sweep_user(user, now, report); !r) {
        ++report.users_failed;
        log::error("Overdue sweep failed for user {}: {}", user.id,
                   r.error().message());
      }
    } catch (const std::exception& e) {
      ++report.users_failed;
      log::error("Overdue sweep failed for user {}: {}", user.id, e.what());
    }
  }

  log::info("Overdue sweep: {} user(s), {} task(s) marked, {} alert(s), {} "
            "failure(s)",
            report.users_scanned, report.tasks_marked,
            report.notifications_emitted, report.users_failed);
  return report;
}

auto OverdueSweep::sweep_user(const User& user, TimePoint now,
                              SweepReport& report) -> Result<void> {
  auto tasks = store_.find_tasks_overdue_as_of(user.id, now);
  if (!tasks)
    return std::unexpected(tasks.error());

  Result<void> outcome = ok();
  std::vector<Task> marked;
  for (auto& task : *tasks) {
    // Only a row still pending changes, so a concurrent run cannot report
    // the same task twice.
    auto changed =
        store_.update_task_status(task.id, TaskStatus::Overdue,
                                  TaskStatus::Pending);
    if (!changed) {
      log::warn("Failed to mark task {} overdue: {}", task.id,
                changed.error().message());
      outcome = std::unexpected(changed.error());
      continue;
    }
    if (*changed) {
      task.status = TaskStatus::Overdue;
      marked.push_back(std::move(task));
    }
  }
  report.tasks_marked += marked.size();

  if (marked.empty() || !user.settings.overdue_alerts)
    return outcome;

  auto preview = json::array();
  for (const auto& task : marked) {
    if (preview.size() >= preview_limit_)
      break;
    preview.push_back({{"id", task.id.str()},
                       {"title", task.title},
                       {"due_at", format_timestamp(task.due_at)},
                       {"priority", priority_name(task.priority)}});
  }

  Notification n{.owner = user.id,
                 .kind = NotificationKind::Overdue,
                 .message = overdue_message(marked.size()),
                 .created_at = now};
  json extra = {{"total", marked.size()}, {"tasks", std::move(preview)}};
  if (auto r = emitter_.deliver(std::move(n), std::move(extra)); !r)
    return std::unexpected(r.error());
  ++report.notifications_emitted;
  return outcome;
}

}  // namespace nudge
