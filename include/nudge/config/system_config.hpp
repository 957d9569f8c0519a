#pragma once

#include "nudge/core/constants.hpp"

#include <cstddef>
#include <string>

namespace nudge {

struct StorageConfig {
  std::string db_file{"nudge.db"};
};

struct SchedulerConfig {
  std::string log_level{"info"};
  std::string log_file;
  // Re-derive every task's reminder from storage when the engine starts.
  bool reconcile_on_start{true};
};

struct SweepConfig {
  std::string overdue_cron{"0 20 * * *"};
  std::string digest_cron{"0 9 * * *"};
  std::size_t overdue_preview_limit{limits::kOverduePreview};
  // Cron fields are matched against UTC shifted by this many minutes.
  int utc_offset_minutes{0};
};

struct SystemConfig {
  StorageConfig storage;
  SchedulerConfig scheduler;
  SweepConfig sweeps;
};

}  // namespace nudge
