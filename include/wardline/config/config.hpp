#pragma once

#include "wardline/common/result.hpp"
#include "wardline/config/schema.hpp"
#include "wardline/memory/config.hpp"
#include "wardline/security/log_monitor.hpp"
#include "wardline/security/sanitize_config.hpp"
#include "wardline/validation/input_validator.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wardline::config {

[[nodiscard]] common::Result<std::filesystem::path> config_path();

/// Takes precedence over $WARDLINE_CONFIG_PATH. A directory resolves to
/// config.toml inside it.
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Reads the config file, or returns defaults when it does not exist.
/// Environment overrides are applied in both cases.
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from_string(const std::string &content);
[[nodiscard]] std::string render_config(const Config &config);

/// Warnings for questionable settings, or failure on the first fatal one.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] common::Result<security::SanitizationConfig> to_sanitization_config(const Config &config);
[[nodiscard]] common::Result<memory::MemoryConfig> to_memory_config(const Config &config);
[[nodiscard]] validation::ValidationConfig to_validation_config(const Config &config);
[[nodiscard]] common::Result<security::MonitorConfig> to_monitor_config(const Config &config);

} // namespace wardline::config
