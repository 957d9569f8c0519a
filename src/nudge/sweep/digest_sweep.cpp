#include "nudge/sweep/digest_sweep.hpp"

#include "nudge/util/log.hpp"

#include <algorithm>
#include <exception>
#include <format>

namespace nudge {

using json = nlohmann::json;

auto digest_message(std::span<const Task> tasks, TimePoint now)
    -> std::string {
  auto overdue = std::ranges::count_if(
      tasks, [](const Task& t) { return t.status == TaskStatus::Overdue; });
  auto pending = std::ranges::count_if(
      tasks, [](const Task& t) { return t.status == TaskStatus::Pending; });

  auto msg = std::format("Daily task summary: {} overdue, {} pending.",
                         overdue, pending);
  auto next = std::ranges::find_if(tasks, [now](const Task& t) {
    return t.status == TaskStatus::Pending && t.due_at >= now;
  });
  if (next != tasks.end()) {
    msg += std::format(" Next deadline: \"{}\" at {}.", next->title,
                       format_timestamp(next->due_at));
  }
  return msg;
}

DigestSweep::DigestSweep(Store& store, NotificationEmitter& emitter)
    : store_(store), emitter_(emitter) {
}

auto DigestSweep::run(TimePoint now) -> SweepReport {
  SweepReport report;
  RunGuard guard(running_);
  if (!guard.acquired()) {
    log::warn("Digest sweep still running, skipping this run");
    report.skipped = true;
    return report;
  }

  auto users = store_.list_users(true);
  if (!users) {
    log::error("Digest sweep: failed to list users: {}",
               users.error().message());
    return report;
  }

  for (const auto& user : *users) {
    if (!user.settings.daily_digest)
      continue;
    ++report.users_scanned;
    try {
      if (auto r = sweep_user(user, now, report); !r) {
        ++report.users_failed;
        log::error("Digest sweep failed for user {}: {}", user.id,
                   r.error().message());
      }
    } catch (const std::exception& e) {
      ++report.users_failed;
      log::error("Digest sweep failed for user {}: {}", user.id, e.what());
    }
  }

  log::info("Digest sweep: {} user(s), {} digest(s), {} failure(s)",
            report.users_scanned, report.notifications_emitted,
            report.users_failed);
  return report;
}

auto DigestSweep::sweep_user(const User& user, TimePoint now,
                             SweepReport& report) -> Result<void> {
  auto tasks = store_.list_tasks(
      TaskQuery{.owner = user.id,
                .statuses = {TaskStatus::Pending, TaskStatus::Overdue}});
  if (!tasks)
    return std::unexpected(tasks.error());
  if (tasks->empty())
    return ok();

  Notification n{.owner = user.id,
                 .kind = NotificationKind::DailyDigest,
                 .message = digest_message(*tasks, now),
                 .created_at = now};
  json extra = {{"outstanding", tasks->size()}};
  if (auto r = emitter_.deliver(std::move(n), std::move(extra)); !r)
    return std::unexpected(r.error());
  ++report.notifications_emitted;
  return ok();
}

}  // namespace nudge
