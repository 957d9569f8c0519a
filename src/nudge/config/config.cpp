#include "nudge/config/config.hpp"

#include "nudge/config/yaml_utils.hpp"
#include "nudge/scheduler/cron.hpp"
#include "nudge/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<nudge::StorageConfig> {
  static bool decode(const Node& node, nudge::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = nudge::yaml_get_or<std::string>(node, "db_file", "nudge.db");
    return true;
  }
};

template <>
struct convert<nudge::SchedulerConfig> {
  static bool decode(const Node& node, nudge::SchedulerConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.log_level = nudge::yaml_get_or<std::string>(node, "log_level", "info");
    s.log_file = nudge::yaml_get_or<std::string>(node, "log_file", "");
    s.reconcile_on_start = nudge::yaml_get_or(node, "reconcile_on_start", true);
    return true;
  }
};

template <>
struct convert<nudge::SweepConfig> {
  static bool decode(const Node& node, nudge::SweepConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    nudge::SweepConfig defaults;
    s.overdue_cron = nudge::yaml_get_or<std::string>(node, "overdue_cron",
                                                     defaults.overdue_cron);
    s.digest_cron = nudge::yaml_get_or<std::string>(node, "digest_cron",
                                                    defaults.digest_cron);
    s.overdue_preview_limit = nudge::yaml_get_or<std::size_t>(
        node, "overdue_preview_limit", defaults.overdue_preview_limit);
    s.utc_offset_minutes = nudge::yaml_get_or(node, "utc_offset_minutes", 0);
    return true;
  }
};

template <>
struct convert<nudge::SystemConfig> {
  static bool decode(const Node& node, nudge::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<nudge::StorageConfig>();
    }
    if (auto scheduler = node["scheduler"]) {
      c.scheduler = scheduler.as<nudge::SchedulerConfig>();
    }
    if (auto sweeps = node["sweeps"]) {
      c.sweeps = sweeps.as<nudge::SweepConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace nudge {

namespace {

constexpr int kMaxUtcOffsetMinutes = 14 * 60;

void to_yaml(YAML::Emitter& out, const StorageConfig& s) {
  out << YAML::BeginMap;
  if (s.db_file != "nudge.db") {
    yaml_emit(out, "db_file", s.db_file);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const SchedulerConfig& s) {
  out << YAML::BeginMap;
  yaml_emit(out, "log_level", s.log_level);
  yaml_emit_if_not_empty(out, "log_file", s.log_file);
  if (!s.reconcile_on_start) {
    yaml_emit(out, "reconcile_on_start", s.reconcile_on_start);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const SweepConfig& s) {
  SweepConfig defaults;
  out << YAML::BeginMap;
  yaml_emit(out, "overdue_cron", s.overdue_cron);
  yaml_emit(out, "digest_cron", s.digest_cron);
  if (s.overdue_preview_limit != defaults.overdue_preview_limit) {
    yaml_emit(out, "overdue_preview_limit", s.overdue_preview_limit);
  }
  if (s.utc_offset_minutes != 0) {
    yaml_emit(out, "utc_offset_minutes", s.utc_offset_minutes);
  }
  out << YAML::EndMap;
}

auto validate(const SystemConfig& config) -> Result<void> {
  const auto& sweeps = config.sweeps;
  for (const auto& expr : {sweeps.overdue_cron, sweeps.digest_cron}) {
    if (!CronExpr::parse(expr)) {
      log::error("Invalid cron expression in sweeps: '{}'", expr);
      return fail(Error::ParseError);
    }
  }
  if (sweeps.utc_offset_minutes < -kMaxUtcOffsetMinutes ||
      sweeps.utc_offset_minutes > kMaxUtcOffsetMinutes) {
    log::error("sweeps.utc_offset_minutes out of range: {}",
               sweeps.utc_offset_minutes);
    return fail(Error::InvalidArgument);
  }
  if (config.storage.db_file.empty()) {
    log::error("storage.db_file must not be empty");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }

  if (auto r = validate(config); !r) {
    return std::unexpected(r.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "storage" << YAML::Value;
  to_yaml(out, config.storage);
  out << YAML::Key << "scheduler" << YAML::Value;
  to_yaml(out, config.scheduler);
  out << YAML::Key << "sweeps" << YAML::Value;
  to_yaml(out, config.sweeps);
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace nudge
