#include "nudge/app/application.hpp"
#include "nudge/cli/commands.hpp"
#include "nudge/config/config.hpp"
#include "nudge/util/daemon.hpp"
#include "nudge/util/log.hpp"

#include <print>

namespace nudge::cli {

auto cmd_serve(const ServeOptions& opts) -> int {
  auto result = ConfigLoader::load_from_file(opts.config_file);
  if (!result) {
    std::println(stderr, "Error: {}", result.error().message());
    return 1;
  }
  auto config = std::move(*result);

  const auto log_file = opts.log_file.value_or(config.scheduler.log_file);
  if (opts.daemon && log_file.empty()) {
    std::println(
        stderr,
        "Error: --daemon requires log_file (set in config or --log-file)");
    return 1;
  }
  if (!log_file.empty() && !log::set_output_file(log_file)) {
    std::println(stderr, "Error: Failed to open log file: {}", log_file);
    return 1;
  }

  if (opts.daemon && !daemonize()) {
    std::println(stderr, "Error: Failed to daemonize");
    return 1;
  }

  log::set_level(config.scheduler.log_level);
  log::start();

  Application app(std::move(config));
  setup_signal_handlers();

  log::info("nudge starting with database {}", app.config().storage.db_file);
  if (auto r = app.start(); !r) {
    log::error("Failed to start: {}", r.error().message());
    log::stop();
    return 1;
  }

  wait_for_shutdown();
  app.stop();

  log::stop();
  return 0;
}

}  // namespace nudge::cli
