#pragma once

#include "nudge/config/system_config.hpp"
#include "nudge/core/error.hpp"

#include <optional>
#include <string>

namespace nudge::cli {

struct ServeOptions {
  std::string config_file;
  std::optional<std::string> log_file;
  bool daemon{false};
};

struct ValidateOptions {
  std::string config_file;
};

enum class SweepKind { Overdue, Digest };

struct SweepOptions {
  std::string config_file;
  std::optional<std::string> db_file;
  SweepKind kind{SweepKind::Overdue};
};

struct NotificationsOptions {
  std::string config_file;
  std::optional<std::string> db_file;
  std::string user;
  std::optional<std::string> mark_read;
  bool mark_all_read{false};
};

// Loads `path` when given (defaults otherwise) and applies a --db override.
[[nodiscard]] auto load_cli_config(const std::string& path,
                                   const std::optional<std::string>& db_file)
    -> Result<SystemConfig>;

[[nodiscard]] auto cmd_serve(const ServeOptions& opts) -> int;
[[nodiscard]] auto cmd_validate(const ValidateOptions& opts) -> int;
[[nodiscard]] auto cmd_sweep(const SweepOptions& opts) -> int;
[[nodiscard]] auto cmd_notifications(const NotificationsOptions& opts) -> int;

}  // namespace nudge::cli
