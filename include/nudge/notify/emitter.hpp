#pragma once

#include "nudge/core/error.hpp"
#include "nudge/model/notification.hpp"
#include "nudge/notify/channel.hpp"
#include "nudge/storage/store.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <string_view>

namespace nudge {

inline constexpr std::string_view kNotificationEvent = "notification";

// JSON shape shared by the push payload and `nudge notifications`.
[[nodiscard]] auto notification_to_json(const Notification& n)
    -> nlohmann::json;

// Persists a notification, then pushes it to the owner's channel. The
// stored record is authoritative: a failed push is logged and the record
// stays.
class NotificationEmitter {
public:
  NotificationEmitter(Store& store, Channel& channel);

  NotificationEmitter(const NotificationEmitter&) = delete;
  auto operator=(const NotificationEmitter&) -> NotificationEmitter& = delete;

  // Assigns an id when `n.id` is empty and marks the record sent. `extra`
  // is attached to the push payload under "data" and not persisted.
  [[nodiscard]] auto deliver(Notification n, nlohmann::json extra = nullptr)
      -> Result<Notification>;

  [[nodiscard]] auto delivered() const noexcept -> std::uint64_t {
    return delivered_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] auto push_failures() const noexcept -> std::uint64_t {
    return push_failures_.load(std::memory_order_relaxed);
  }

private:
  Store& store_;
  Channel& channel_;
  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> push_failures_{0};
};

}  // namespace nudge
