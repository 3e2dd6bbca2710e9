#pragma once

#include "sessionflow/common/result.hpp"
#include "sessionflow/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sessionflow::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Defaults, then config.toml (when present), then environment overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Hard problems fail; soft ones come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Renders the effective configuration with the token masked.
[[nodiscard]] std::string describe_config(const Config &config);

} // namespace sessionflow::config
