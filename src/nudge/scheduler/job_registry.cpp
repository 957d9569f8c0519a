#include "nudge/scheduler/job_registry.hpp"

#include "nudge/util/log.hpp"

#include <algorithm>

namespace nudge {

JobRegistry::JobRegistry(Timer& timer) : timer_(timer) {
}

auto JobRegistry::drop_job(Slot& slot) -> void {
  if (slot.job) {
    timer_.cancel(slot.job->handle);
    slot.job.reset();
  }
}

auto JobRegistry::begin(std::string_view key) -> JobTicket {
  std::lock_guard lock(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end()) {
    it = slots_.emplace(std::string(key), Slot{}).first;
  }
  it->second.ticket = next_ticket_++;
  it->second.in_flight = true;
  return JobTicket{it->second.ticket};
}

auto JobRegistry::commit(std::string_view key, JobTicket ticket,
                         JobEntry entry) -> bool {
  std::lock_guard lock(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end() || it->second.ticket != ticket.value) {
    timer_.cancel(entry.handle);
    log::debug("Discarded superseded job for {}", key);
    return false;
  }
  drop_job(it->second);
  it->second.job = entry;
  it->second.in_flight = false;
  return true;
}

auto JobRegistry::clear(std::string_view key, JobTicket ticket) -> bool {
  std::lock_guard lock(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end() || it->second.ticket != ticket.value)
    return false;
  drop_job(it->second);
  slots_.erase(it);
  return true;
}

auto JobRegistry::replace(std::string_view key, JobEntry entry) -> void {
  std::lock_guard lock(mu_);
  auto [it, inserted] = slots_.try_emplace(std::string(key));
  auto& slot = it->second;
  drop_job(slot);
  slot.ticket = next_ticket_++;
  slot.in_flight = false;
  slot.job = entry;
}

auto JobRegistry::cancel(std::string_view key) -> bool {
  std::lock_guard lock(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end())
    return false;
  bool had_job = it->second.job.has_value();
  drop_job(it->second);
  slots_.erase(it);
  return had_job;
}

auto JobRegistry::release(std::string_view key, TimerHandle handle) -> bool {
  std::lock_guard lock(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end() || !it->second.job ||
      it->second.job->handle != handle) {
    return false;
  }
  it->second.job.reset();
  // Keep the slot while a pass is running so its ticket stays valid.
  if (!it->second.in_flight)
    slots_.erase(it);
  return true;
}

auto JobRegistry::holds(std::string_view key, TimerHandle handle) const
    -> bool {
  std::lock_guard lock(mu_);
  auto it = slots_.find(key);
  return it != slots_.end() && it->second.job &&
         it->second.job->handle == handle;
}

auto JobRegistry::find(std::string_view key) const -> std::optional<JobEntry> {
  std::lock_guard lock(mu_);
  auto it = slots_.find(key);
  if (it == slots_.end())
    return std::nullopt;
  return it->second.job;
}

auto JobRegistry::size() const -> std::size_t {
  std::lock_guard lock(mu_);
  return static_cast<std::size_t>(std::ranges::count_if(
      slots_, [](const auto& kv) { return kv.second.job.has_value(); }));
}

auto JobRegistry::keys() const -> std::vector<std::string> {
  std::lock_guard lock(mu_);
  std::vector<std::string> out;
  for (const auto& [key, slot] : slots_) {
    if (slot.job)
      out.push_back(key);
  }
  return out;
}

auto JobRegistry::cancel_all() -> void {
  std::lock_guard lock(mu_);
  for (auto& [key, slot] : slots_) {
    drop_job(slot);
  }
  slots_.clear();
}

}  // namespace nudge
