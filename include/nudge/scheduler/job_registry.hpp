#pragma once

#include "nudge/core/error.hpp"
#include "nudge/scheduler/timer.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace nudge {

struct JobEntry {
  TimerHandle handle;
  TimePoint fire_at{};
};

// Ticket issued by JobRegistry::begin(); a later begin() or cancel() on the
// same key invalidates it.
struct JobTicket {
  std::uint64_t value{0};
};

// Owns every live timer handle, keyed by task id or sweep name. A key maps
// to at most one handle; installing a new one cancels the previous one
// under the same lock.
class JobRegistry {
public:
  explicit JobRegistry(Timer& timer);
  ~JobRegistry() = default;

  JobRegistry(const JobRegistry&) = delete;
  auto operator=(const JobRegistry&) -> JobRegistry& = delete;

  // Starts a scheduling pass for `key`. Only the most recent ticket of a key
  // may commit or clear.
  [[nodiscard]] auto begin(std::string_view key) -> JobTicket;

  // Installs `entry` under `key`, cancelling the previous handle. If the
  // ticket was superseded, `entry.handle` is cancelled instead and false is
  // returned.
  auto commit(std::string_view key, JobTicket ticket, JobEntry entry) -> bool;

  // Ends a pass that resolved to nothing: cancels any job under `key`.
  auto clear(std::string_view key, JobTicket ticket) -> bool;

  // Unconditional install, used for the recurring sweeps.
  auto replace(std::string_view key, JobEntry entry) -> void;

  // Cancels and removes `key`; no-op when absent. Invalidates outstanding
  // tickets for the key.
  auto cancel(std::string_view key) -> bool;

  // Drops `key` without cancelling the timer, but only while it still holds
  // `handle`. Used by a one-shot when it fires.
  auto release(std::string_view key, TimerHandle handle) -> bool;

  [[nodiscard]] auto holds(std::string_view key, TimerHandle handle) const
      -> bool;
  [[nodiscard]] auto find(std::string_view key) const
      -> std::optional<JobEntry>;
  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto keys() const -> std::vector<std::string>;

  auto cancel_all() -> void;

private:
  struct Slot {
    std::optional<JobEntry> job;
    std::uint64_t ticket{0};
    bool in_flight{false};
  };

  using SlotMap = std::unordered_map<std::string, Slot, StringHash, StringEqual>;

  auto drop_job(Slot& slot) -> void;

  Timer& timer_;
  mutable std::mutex mu_;
  SlotMap slots_;
  std::uint64_t next_ticket_{1};
};

}  // namespace nudge
