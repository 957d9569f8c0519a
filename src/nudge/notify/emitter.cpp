#include "nudge/notify/emitter.hpp"

#include "nudge/model/state_strings.hpp"
#include "nudge/util/log.hpp"

namespace nudge {

using json = nlohmann::json;

auto notification_to_json(const Notification& n) -> json {
  json j = {{"id", n.id.str()},
            {"user", n.owner.str()},
            {"task", n.task ? json(n.task->str()) : json(nullptr)},
            {"type", notification_kind_name(n.kind)},
            {"message", n.message},
            {"created_at", format_timestamp(n.created_at)},
            {"sent", n.sent},
            {"read", n.read}};
  return j;
}

NotificationEmitter::NotificationEmitter(Store& store, Channel& channel)
    : store_(store), channel_(channel) {
}

auto NotificationEmitter::deliver(Notification n, json extra)
    -> Result<Notification> {
  if (n.id.empty()) {
    n.id = NotificationId{generate_uuid()};
  }
  n.sent = true;

  if (auto r = store_.create_notification(n); !r) {
    log::error("Failed to persist {} notification for user {}: {}",
               notification_kind_name(n.kind), n.owner, r.error().message());
    return std::unexpected(r.error());
  }
  delivered_.fetch_add(1, std::memory_order_relaxed);

  auto payload = notification_to_json(n);
  if (!extra.is_null()) {
    payload["data"] = std::move(extra);
  }
  // Task titles are user text and may not be valid UTF-8.
  auto body =
      payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (auto r = channel_.publish(n.owner, kNotificationEvent, body); !r) {
    push_failures_.fetch_add(1, std::memory_order_relaxed);
    log::warn("Push of notification {} to user {} failed: {}", n.id, n.owner,
              r.error().message());
  }

  log::debug("Delivered {} notification {} to user {}",
             notification_kind_name(n.kind), n.id, n.owner);
  return n;
}

}  // namespace nudge
