#pragma once

#include "storyloop/config/system_config.hpp"
#include "storyloop/core/error.hpp"

#include <filesystem>
#include <string_view>

namespace storyloop {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto to_string(const SystemConfig& config)
      -> std::string;
};

// Checks value ranges that YAML typing cannot express.
[[nodiscard]] auto validate_config(const SystemConfig& config) -> Result<void>;

// storage.db_file resolved against state_dir unless absolute.
[[nodiscard]] auto database_path(const SystemConfig& config)
    -> std::filesystem::path;

}  // namespace storyloop
