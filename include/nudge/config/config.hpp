#pragma once

#include "nudge/config/system_config.hpp"
#include "nudge/core/error.hpp"

#include <string>
#include <string_view>

namespace nudge {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
  // Emits only the settings that differ from their defaults.
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

}  // namespace nudge
