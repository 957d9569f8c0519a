#pragma once

#include "nudge/notify/channel.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace nudge {

// In-process Channel. Subscribers register per user; publish() fans out to
// every subscriber of that user on the calling thread. Publishing before
// start() or after stop() fails with Error::ChannelClosed.
class EventHub final : public Channel {
public:
  using SubscriptionId = std::uint64_t;
  using Handler =
      std::function<void(std::string_view event, const std::string& payload)>;

  EventHub();
  ~EventHub() override;

  EventHub(const EventHub&) = delete;
  auto operator=(const EventHub&) -> EventHub& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_open() const -> bool;

  [[nodiscard]] auto subscribe(const UserId& user, Handler handler)
      -> SubscriptionId;
  auto unsubscribe(SubscriptionId id) -> bool;

  [[nodiscard]] auto publish(const UserId& user, std::string_view event,
                             std::string payload) -> Result<void> override;

  [[nodiscard]] auto subscriber_count() const -> std::size_t;
  [[nodiscard]] auto subscriber_count(const UserId& user) const -> std::size_t;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace nudge
