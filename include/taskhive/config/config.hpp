#pragma once

#include "taskhive/config/system_config.hpp"
#include "taskhive/core/error.hpp"

#include <string>
#include <string_view>

namespace taskhive {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
  // Emits only the keys that differ from their defaults.
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

}  // namespace taskhive
