#pragma once

#include "nudge/notify/emitter.hpp"
#include "nudge/storage/store.hpp"
#include "nudge/sweep/sweep.hpp"

#include <atomic>
#include <span>
#include <string>

namespace nudge {

// Sends each opted-in user a summary of their outstanding tasks. Users with
// nothing outstanding get nothing.
class DigestSweep {
public:
  DigestSweep(Store& store, NotificationEmitter& emitter);

  DigestSweep(const DigestSweep&) = delete;
  auto operator=(const DigestSweep&) -> DigestSweep& = delete;

  auto run(TimePoint now) -> SweepReport;

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

private:
  auto sweep_user(const User& user, TimePoint now, SweepReport& report)
      -> Result<void>;

  Store& store_;
  NotificationEmitter& emitter_;
  std::atomic<bool> running_{false};
};

// `tasks` are the user's pending and overdue tasks, ordered by due date.
[[nodiscard]] auto digest_message(std::span<const Task> tasks, TimePoint now)
    -> std::string;

}  // namespace nudge
