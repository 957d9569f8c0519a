#include "nudge/cli/commands.hpp"
#include "nudge/config/config.hpp"
#include "nudge/scheduler/cron.hpp"
#include "nudge/util/util.hpp"

#include <chrono>
#include <print>
#include <utility>

namespace nudge::cli {

auto cmd_validate(const ValidateOptions& opts) -> int {
  auto result = ConfigLoader::load_from_file(opts.config_file);
  if (!result) {
    std::println(stderr, "✗ {} - {}", opts.config_file,
                 result.error().message());
    return 1;
  }
  const auto& config = *result;
  std::println("✓ {} - Valid", opts.config_file);

  auto now = Clock::now();
  std::chrono::minutes offset{config.sweeps.utc_offset_minutes};
  for (const auto& [name, expr] :
       {std::pair{"overdue", config.sweeps.overdue_cron},
        std::pair{"digest", config.sweeps.digest_cron}}) {
    // Already validated by the loader.
    auto cron = CronExpr::parse(expr);
    if (!cron)
      continue;
    std::println("  {:<8} '{}' next at {}", name, expr,
                 format_timestamp(cron->next_after(now, offset)));
  }

  std::println("\n{}", ConfigLoader::to_string(config));
  return 0;
}

}  // namespace nudge::cli
