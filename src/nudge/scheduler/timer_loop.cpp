#include "nudge/scheduler/timer_loop.hpp"

#include "nudge/core/constants.hpp"
#include "nudge/util/log.hpp"

#include <sys/eventfd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>

#include <poll.h>
#include <unistd.h>

namespace nudge {

TimerLoop::TimerLoop(std::chrono::minutes cron_utc_offset)
    : cron_utc_offset_(cron_utc_offset) {
  event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (event_fd_ < 0) {
    log::error("Failed to create eventfd: {}", std::strerror(errno));
  }
}

TimerLoop::~TimerLoop() {
  stop();
  if (event_fd_ >= 0) {
    close(event_fd_);
    event_fd_ = -1;
  }
}

auto TimerLoop::start() -> void {
  if (running_.exchange(true))
    return;
  loop_thread_ = std::thread([this] { run_loop(); });
  log::debug("Timer loop started");
}

auto TimerLoop::stop() -> void {
  if (!running_.exchange(false))
    return;
  post(ShutdownEvent{});
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  log::debug("Timer loop stopped");
}

auto TimerLoop::now() const -> TimePoint {
  return Clock::now();
}

auto TimerLoop::reserve() -> TimerHandle {
  auto id = next_id_.fetch_add(1, std::memory_order_relaxed);
  std::lock_guard lock(events_mu_);
  live_.insert(id);
  return TimerHandle{id};
}

auto TimerLoop::arm(TimerHandle handle, TimePoint when, Callback cb) -> void {
  post(ArmEvent{handle.id, when, std::move(cb), std::nullopt});
}

auto TimerLoop::every(const CronExpr& schedule, Callback cb) -> TimerHandle {
  auto id = next_id_.fetch_add(1, std::memory_order_relaxed);
  {
    std::lock_guard lock(events_mu_);
    live_.insert(id);
  }
  auto first = schedule.next_after(now(), cron_utc_offset_);
  post(ArmEvent{id, first, std::move(cb), schedule});
  return TimerHandle{id};
}

auto TimerLoop::cancel(TimerHandle handle) -> bool {
  {
    std::lock_guard lock(events_mu_);
    if (live_.erase(handle.id) == 0)
      return false;
  }
  post(CancelEvent{handle.id});
  return true;
}

auto TimerLoop::post(TimerEvent event) -> void {
  {
    std::lock_guard lock(events_mu_);
    events_.push_back(std::move(event));
  }
  notify();
}

auto TimerLoop::notify() -> void {
  std::uint64_t val = 1;
  if (write(event_fd_, &val, sizeof(val)) < 0) {
    log::warn("Failed to write to event_fd: {}", std::strerror(errno));
  }
}

auto TimerLoop::run_loop() -> void {
  pollfd pfd{event_fd_, POLLIN, 0};

  while (running_.load(std::memory_order_relaxed)) {
    process_events();
    if (!running_.load(std::memory_order_relaxed))
      break;

    tick();

    auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        timing::kIdleWait);
    if (auto deadline = next_deadline(); deadline != TimePoint::max()) {
      auto delay = std::chrono::ceil<std::chrono::milliseconds>(deadline - now());
      wait = std::clamp(delay, std::chrono::milliseconds(0), wait);
    }

    int ret = ::poll(&pfd, 1, static_cast<int>(wait.count()));
    if (ret < 0 && errno != EINTR) {
      log::error("poll failed: {}", std::strerror(errno));
      break;
    }

    std::uint64_t val;
    while (::read(event_fd_, &val, sizeof(val)) > 0) {
    }
  }

  // Timers do not survive a stop; a later start() begins empty.
  {
    std::lock_guard lock(events_mu_);
    events_.clear();
    live_.clear();
  }
  entries_.clear();
  schedule_.clear();
  armed_.store(0, std::memory_order_relaxed);
}

auto TimerLoop::process_events() -> void {
  std::deque<TimerEvent> batch;
  {
    std::lock_guard lock(events_mu_);
    batch.swap(events_);
  }
  for (auto& event : batch) {
    std::visit([this](auto& e) { handle_event(e); }, event);
  }
  armed_.store(entries_.size(), std::memory_order_relaxed);
}

auto TimerLoop::tick() -> void {
  auto current = now();

  while (!schedule_.empty() && schedule_.begin()->first <= current) {
    auto [when, id] = *schedule_.begin();
    schedule_.erase(schedule_.begin());

    auto it = entries_.find(id);
    if (it == entries_.end())
      continue;

    bool recurring = it->second.schedule.has_value();
    bool alive = false;
    {
      std::lock_guard lock(events_mu_);
      alive = recurring ? live_.contains(id) : live_.erase(id) > 0;
    }
    if (!alive) {
      entries_.erase(it);
      continue;
    }

    // Copy: the callback may arm or cancel timers, which only queues events.
    auto callback = it->second.callback;
    if (recurring) {
      auto next = it->second.schedule->next_after(current, cron_utc_offset_);
      it->second.slot = schedule_.emplace(next, id);
    } else {
      entries_.erase(it);
    }

    try {
      callback();
    } catch (const std::exception& e) {
      log::error("Timer {} callback threw: {}", id, e.what());
    }
  }
  armed_.store(entries_.size(), std::memory_order_relaxed);
}

auto TimerLoop::next_deadline() const -> TimePoint {
  return schedule_.empty() ? TimePoint::max() : schedule_.begin()->first;
}

auto TimerLoop::handle_event(ArmEvent& e) -> void {
  {
    // Cancelled between reserve() and arm().
    std::lock_guard lock(events_mu_);
    if (!live_.contains(e.id))
      return;
  }
  if (e.when == TimePoint::max()) {
    log::warn("Timer {} has no future fire time, dropping", e.id);
    std::lock_guard lock(events_mu_);
    live_.erase(e.id);
    return;
  }
  auto slot = schedule_.emplace(e.when, e.id);
  entries_.insert_or_assign(
      e.id, Entry{std::move(e.callback), std::move(e.schedule), slot});
}

auto TimerLoop::handle_event(CancelEvent& e) -> void {
  auto it = entries_.find(e.id);
  if (it == entries_.end())
    return;
  schedule_.erase(it->second.slot);
  entries_.erase(it);
}

auto TimerLoop::handle_event(ShutdownEvent&) -> void {
  running_.store(false);
}

}  // namespace nudge
