#include "nudge/app/application.hpp"
#include "nudge/cli/commands.hpp"
#include "nudge/config/config.hpp"
#include "nudge/util/log.hpp"

#include <print>

namespace nudge::cli {

auto load_cli_config(const std::string& path,
                     const std::optional<std::string>& db_file)
    -> Result<Config> {
  Config config;
  if (!path.empty()) {
    auto result = ConfigLoader::load_from_file(path);
    if (!result)
      return std::unexpected(result.error());
    config = std::move(*result);
  }
  if (db_file) {
    config.storage.db_file = *db_file;
  }
  return config;
}

auto cmd_sweep(const SweepOptions& opts) -> int {
  auto config = load_cli_config(opts.config_file, opts.db_file);
  if (!config) {
    std::println(stderr, "Error: {}", config.error().message());
    return 1;
  }
  log::set_level(config->scheduler.log_level);

  Application app(std::move(*config));
  if (auto r = app.open_storage(); !r) {
    std::println(stderr, "Error: Failed to open database: {}",
                 r.error().message());
    return 1;
  }
  // No clients are attached to a one-off run; pushes go nowhere.
  app.hub().start();

  auto report = opts.kind == SweepKind::Overdue ? app.run_overdue_sweep()
                                                : app.run_digest_sweep();
  app.hub().stop();

  std::println("Users scanned:  {}", report.users_scanned);
  if (opts.kind == SweepKind::Overdue) {
    std::println("Tasks marked:   {}", report.tasks_marked);
  }
  std::println("Notifications:  {}", report.notifications_emitted);
  std::println("Failures:       {}", report.users_failed);
  return report.users_failed > 0 ? 1 : 0;
}

}  // namespace nudge::cli
