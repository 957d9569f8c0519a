#pragma once

#include <atomic>
#include <cstddef>

namespace nudge {

struct SweepReport {
  std::size_t users_scanned{0};
  std::size_t users_failed{0};
  std::size_t tasks_marked{0};
  std::size_t notifications_emitted{0};
  // The run was refused because a previous run was still active.
  bool skipped{false};
};

// Claims a sweep's running flag for the lifetime of the guard. A guard
// that fails to claim it leaves the flag alone.
class RunGuard {
public:
  explicit RunGuard(std::atomic<bool>& flag) noexcept
      : flag_(flag), acquired_(!flag.exchange(true, std::memory_order_acq_rel)) {
  }
  ~RunGuard() {
    if (acquired_)
      flag_.store(false, std::memory_order_release);
  }

  RunGuard(const RunGuard&) = delete;
  auto operator=(const RunGuard&) -> RunGuard& = delete;

  [[nodiscard]] auto acquired() const noexcept -> bool { return acquired_; }

private:
  std::atomic<bool>& flag_;
  bool acquired_;
};

}  // namespace nudge
