#pragma once

#include "sandcastle/common/result.hpp"
#include "sandcastle/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sandcastle::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Parse TOML text into a Config without touching the environment.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// Load `.env` files, the config file (if any) and environment overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Returns warnings on success; hard errors fail.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace sandcastle::config
