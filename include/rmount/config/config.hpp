#pragma once

#include "rmount/common/result.hpp"
#include "rmount/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rmount::config {

/// Directory holding the config file: the override's parent, or
/// `~/.rmount` (created owner-only). `RMOUNT_CONFIG_PATH` acts as an override.
[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Loads the config file if present; a missing file yields the defaults.
/// Environment overrides are applied last.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// RMOUNT_POLL_INTERVAL_SECONDS, RMOUNT_STARTUP_TIMEOUT_SECONDS,
/// RMOUNT_SHUTDOWN_GRACE_SECONDS, RMOUNT_MAX_RESTARTS, RMOUNT_OBSERVABILITY
/// and RMOUNT_RCLONE. Unparseable numbers are ignored.
void apply_env_overrides(Config &config);

} // namespace rmount::config
