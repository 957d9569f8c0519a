#include "nudge/notify/event_hub.hpp"

#include "nudge/util/log.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <vector>

namespace nudge {

struct EventHub::Impl {
  struct Subscriber {
    SubscriptionId id;
    UserId user;
    Handler handler;
  };

  std::vector<Subscriber> subscribers;
  SubscriptionId next_id{1};
  bool open{false};
  mutable std::mutex mu;
};

EventHub::EventHub() : impl_(std::make_unique<Impl>()) {
}

EventHub::~EventHub() = default;

auto EventHub::start() -> void {
  std::lock_guard lock(impl_->mu);
  impl_->open = true;
}

auto EventHub::stop() -> void {
  std::lock_guard lock(impl_->mu);
  impl_->open = false;
  impl_->subscribers.clear();
}

auto EventHub::is_open() const -> bool {
  std::lock_guard lock(impl_->mu);
  return impl_->open;
}

auto EventHub::subscribe(const UserId& user, Handler handler)
    -> SubscriptionId {
  std::lock_guard lock(impl_->mu);
  auto id = impl_->next_id++;
  impl_->subscribers.push_back({id, user, std::move(handler)});
  return id;
}

auto EventHub::unsubscribe(SubscriptionId id) -> bool {
  std::lock_guard lock(impl_->mu);
  return std::erase_if(impl_->subscribers, [id](const Impl::Subscriber& s) {
           return s.id == id;
         }) > 0;
}

auto EventHub::publish(const UserId& user, std::string_view event,
                       std::string payload) -> Result<void> {
  std::vector<Handler> targets;
  {
    std::lock_guard lock(impl_->mu);
    if (!impl_->open)
      return fail(Error::ChannelClosed);
    for (const auto& s : impl_->subscribers) {
      if (s.user == user)
        targets.push_back(s.handler);
    }
  }

  // Handlers run outside the lock so they may unsubscribe themselves.
  for (auto& handler : targets) {
    try {
      handler(event, payload);
    } catch (const std::exception& e) {
      log::warn("Subscriber of user {} threw on '{}': {}", user, event,
                e.what());
    }
  }
  log::trace("Published '{}' to {} subscriber(s) of user {}", event,
             targets.size(), user);
  return ok();
}

auto EventHub::subscriber_count() const -> std::size_t {
  std::lock_guard lock(impl_->mu);
  return impl_->subscribers.size();
}

auto EventHub::subscriber_count(const UserId& user) const -> std::size_t {
  std::lock_guard lock(impl_->mu);
  return static_cast<std::size_t>(std::ranges::count_if(
      impl_->subscribers,
      [&user](const Impl::Subscriber& s) { return s.user == user; }));
}

}  // namespace nudge
