#pragma once

#include "nudge/scheduler/cron.hpp"
#include "nudge/util/util.hpp"

#include <cstdint>
#include <functional>
#include <utility>

namespace nudge {

struct TimerHandle {
  std::uint64_t id{0};

  [[nodiscard]] explicit operator bool() const noexcept { return id != 0; }
  friend auto operator==(TimerHandle, TimerHandle) -> bool = default;
};

// Scheduling primitive. Callbacks of one Timer never run concurrently with
// each other. cancel() is best effort: a callback already due may still run.
class Timer {
public:
  using Callback = std::function<void()>;

  virtual ~Timer() = default;

  [[nodiscard]] virtual auto now() const -> TimePoint = 0;

  // Hands out a handle without arming anything. Cancelling it before arm()
  // makes the later arm() a no-op.
  [[nodiscard]] virtual auto reserve() -> TimerHandle = 0;

  // One-shot at `when` under a reserved handle; a time in the past fires on
  // the next turn.
  virtual auto arm(TimerHandle handle, TimePoint when, Callback cb) -> void = 0;

  [[nodiscard]] auto at(TimePoint when, Callback cb) -> TimerHandle {
    auto handle = reserve();
    arm(handle, when, std::move(cb));
    return handle;
  }

  // Recurring on `schedule` until cancelled.
  [[nodiscard]] virtual auto every(const CronExpr& schedule, Callback cb)
      -> TimerHandle = 0;

  // Returns false for an unknown or already-cancelled handle.
  virtual auto cancel(TimerHandle handle) -> bool = 0;
};

}  // namespace nudge
