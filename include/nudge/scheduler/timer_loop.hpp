#pragma once

#include "nudge/scheduler/timer.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <variant>

namespace nudge {

// Single-threaded timer loop. Callers post events through a queue and wake
// the loop via eventfd; all timer state is owned by the loop thread and every
// callback runs there.
class TimerLoop final : public Timer {
public:
  explicit TimerLoop(std::chrono::minutes cron_utc_offset = {});
  ~TimerLoop() override;

  TimerLoop(const TimerLoop&) = delete;
  auto operator=(const TimerLoop&) -> TimerLoop& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load();
  }

  [[nodiscard]] auto now() const -> TimePoint override;
  [[nodiscard]] auto reserve() -> TimerHandle override;
  auto arm(TimerHandle handle, TimePoint when, Callback cb) -> void override;
  [[nodiscard]] auto every(const CronExpr& schedule, Callback cb)
      -> TimerHandle override;
  auto cancel(TimerHandle handle) -> bool override;

  // Timers currently armed, as last seen by the loop thread.
  [[nodiscard]] auto armed() const noexcept -> std::size_t {
    return armed_.load(std::memory_order_relaxed);
  }

private:
  struct ArmEvent {
    std::uint64_t id;
    TimePoint when;
    Callback callback;
    std::optional<CronExpr> schedule;
  };
  struct CancelEvent {
    std::uint64_t id;
  };
  struct ShutdownEvent {};
  using TimerEvent = std::variant<ArmEvent, CancelEvent, ShutdownEvent>;

  using Schedule = std::multimap<TimePoint, std::uint64_t>;

  struct Entry {
    Callback callback;
    std::optional<CronExpr> schedule;
    Schedule::iterator slot;
  };

  auto run_loop() -> void;
  auto post(TimerEvent event) -> void;
  auto process_events() -> void;
  auto tick() -> void;
  auto notify() -> void;
  [[nodiscard]] auto next_deadline() const -> TimePoint;

  auto handle_event(ArmEvent& e) -> void;
  auto handle_event(CancelEvent& e) -> void;
  auto handle_event(ShutdownEvent& e) -> void;

  std::chrono::minutes cron_utc_offset_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> next_id_{1};
  std::atomic<std::size_t> armed_{0};
  int event_fd_{-1};
  std::thread loop_thread_;

  std::mutex events_mu_;
  std::deque<TimerEvent> events_;
  // Ids handed out but not yet cancelled or finished; lets cancel() answer
  // synchronously.
  std::unordered_set<std::uint64_t> live_;

  // Loop thread only
  std::unordered_map<std::uint64_t, Entry> entries_;
  Schedule schedule_;
};

}  // namespace nudge
