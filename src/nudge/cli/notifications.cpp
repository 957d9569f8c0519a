#include "nudge/cli/commands.hpp"
#include "nudge/notify/emitter.hpp"
#include "nudge/storage/persistence.hpp"
#include "nudge/util/log.hpp"

#include <print>

namespace nudge::cli {

auto cmd_notifications(const NotificationsOptions& opts) -> int {
  auto config = load_cli_config(opts.config_file, opts.db_file);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  log::set_level(config->scheduler.log_level);

  Persistence db(config->storage.db_file);
  if (auto r = db.open(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }

  UserId user{opts.user};
  if (opts.mark_read) {
    if (auto r = db.mark_notification_read(user, NotificationId{*opts.mark_read});
        !r) {
      std::println(stderr, "Error: {}: {}", *opts.mark_read,
                   r.error().message());
      return 1;
    }
    std::println("Marked {} as read", *opts.mark_read);
    return 0;
  }
  if (opts.mark_all_read) {
    auto r = db.mark_all_notifications_read(user);
    if (!r) {
      std::println(stderr, "Error: {}", r.error().message());
      return 1;
    }
    std::println("Marked {} notification(s) as read", *r);
    return 0;
  }

  auto list = db.list_notifications(user);
  if (!list) {
    std::println(stderr, "Error: {}", list.error().message());
    return 1;
  }
  if (list->empty()) {
    std::println("No notifications for user {}", user);
    return 0;
  }
  for (const auto& n : *list) {
    std::println("{}", notification_to_json(n).dump(
                           -1, ' ', false,
                           nlohmann::json::error_handler_t::replace));
  }
  return 0;
}

}  // namespace nudge::cli
