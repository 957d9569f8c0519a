#pragma once

#include "nudge/core/constants.hpp"
#include "nudge/notify/emitter.hpp"
#include "nudge/storage/store.hpp"
#include "nudge/sweep/sweep.hpp"

#include <atomic>
#include <cstddef>

namespace nudge {

// Marks past-due pending tasks overdue and sends each affected user one
// aggregated alert. A task is transitioned, and therefore reported, once.
class OverdueSweep {
public:
  OverdueSweep(Store& store, NotificationEmitter& emitter,
               std::size_t preview_limit = limits::kOverduePreview);

  OverdueSweep(const OverdueSweep&) = delete;
  auto operator=(const OverdueSweep&) -> OverdueSweep& = delete;

  auto run(TimePoint now) -> SweepReport;

  [[nodiscard]] auto is_running() const noexcept -> bool {
    return running_.load(std::memory_order_acquire);
  }

private:
  auto sweep_user(const User& user, TimePoint now, SweepReport& report)
      -> Result<void>;

  Store& store_;
  NotificationEmitter& emitter_;
  std::size_t preview_limit_;
  std::atomic<bool> running_{false};
};

[[nodiscard]] auto overdue_message(std::size_t count) -> std::string;

}  // namespace nudge
