#pragma once

#include "tracescope/common/result.hpp"
#include "tracescope/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tracescope::config {

/// `~/.tracescope`, or the directory holding an overridden config file.
[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();

/// Overrides the config location for this process. Takes precedence over
/// TRACESCOPE_CONFIG_PATH.
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

/// Built-in defaults with `~` and environment references in directories expanded.
[[nodiscard]] Config default_config();

/// Effective configuration: the config file (or defaults when it does not exist), then
/// `.env` and TRACESCOPE_* environment overrides.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_file(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

/// TOML text that parse_config reads back to the same values.
[[nodiscard]] std::string render_config(const Config &config);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace tracescope::config
