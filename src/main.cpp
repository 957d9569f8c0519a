#include "nudge/cli/commands.hpp"

#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>

namespace {

void print_usage(const char* prog) {
  std::println("nudge - task reminder and notification scheduler");
  std::println("Usage: {} <command> [OPTIONS]", prog);
  std::println("");
  std::println("Commands:");
  std::println("  serve          Run the scheduler until SIGINT/SIGTERM");
  std::println("  validate       Check a config file and show sweep times");
  std::println("  sweep <kind>   Run one sweep now (overdue | digest)");
  std::println("  notifications  List or acknowledge a user's notifications");
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           Database file override");
  std::println("  --log-file <file>     Log file (serve)");
  std::println("  -d, --daemon          Run as daemon (serve)");
  std::println("  --user <id>           User id (notifications)");
  std::println("  --read <id>           Mark one notification read");
  std::println("  --read-all            Mark all notifications read");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
  std::println("");
  std::println("Examples:");
  std::println("  {} serve -c nudge.example.yaml", prog);
  std::println("  {} sweep overdue -c nudge.example.yaml", prog);
  std::println("  {} notifications --user u1 --db nudge.db", prog);
}

void print_version() {
  std::println("nudge v0.1.0");
}

struct Options {
  std::string command;
  std::string sweep_kind;
  std::string config_file;
  std::optional<std::string> db_file;
  std::optional<std::string> log_file;
  std::string user;
  std::optional<std::string> mark_read;
  bool mark_all_read = false;
  bool daemon = false;
};

auto require_value(int& i, int argc, char* argv[], std::string_view flag)
    -> std::string {
  if (++i >= argc) {
    std::println(stderr, "Error: {} requires an argument", flag);
    std::exit(1);
  }
  return argv[i];
}

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      opts.config_file = require_value(i, argc, argv, arg);
    } else if (arg == "--db") {
      opts.db_file = require_value(i, argc, argv, arg);
    } else if (arg == "--log-file") {
      opts.log_file = require_value(i, argc, argv, arg);
    } else if (arg == "--user") {
      opts.user = require_value(i, argc, argv, arg);
    } else if (arg == "--read") {
      opts.mark_read = require_value(i, argc, argv, arg);
    } else if (arg == "--read-all") {
      opts.mark_all_read = true;
    } else if (arg == "-d" || arg == "--daemon") {
      opts.daemon = true;
    } else if (!arg.starts_with('-') && opts.command.empty()) {
      opts.command = arg;
    } else if (!arg.starts_with('-') && opts.command == "sweep" &&
               opts.sweep_kind.empty()) {
      opts.sweep_kind = arg;
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto require_config(const Options& opts) -> bool {
  if (opts.config_file.empty()) {
    std::println(stderr, "Error: {} requires -c <file>", opts.command);
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace nudge::cli;

  auto opts = parse_args(argc, argv);

  if (opts.command == "serve") {
    if (!require_config(opts))
      return 1;
    return cmd_serve(ServeOptions{.config_file = opts.config_file,
                                  .log_file = opts.log_file,
                                  .daemon = opts.daemon});
  }

  if (opts.command == "validate") {
    if (!require_config(opts))
      return 1;
    return cmd_validate(ValidateOptions{.config_file = opts.config_file});
  }

  if (opts.command == "sweep") {
    SweepKind kind;
    if (opts.sweep_kind == "overdue") {
      kind = SweepKind::Overdue;
    } else if (opts.sweep_kind == "digest") {
      kind = SweepKind::Digest;
    } else {
      std::println(stderr, "Error: sweep requires 'overdue' or 'digest'");
      return 1;
    }
    return cmd_sweep(SweepOptions{.config_file = opts.config_file,
                                  .db_file = opts.db_file,
                                  .kind = kind});
  }

  if (opts.command == "notifications") {
    if (opts.user.empty()) {
      std::println(stderr, "Error: notifications requires --user <id>");
      return 1;
    }
    return cmd_notifications(NotificationsOptions{
        .config_file = opts.config_file,
        .db_file = opts.db_file,
        .user = opts.user,
        .mark_read = opts.mark_read,
        .mark_all_read = opts.mark_all_read});
  }

  print_usage(argv[0]);
  return opts.command.empty() ? 0 : 1;
}
