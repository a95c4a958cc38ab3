#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace wardline::config {

struct CustomPatternConfig {
  std::string pattern;
  std::string tag;
  std::string severity = "medium";
};

struct SanitizationSection {
  std::string protection_level = "standard";
  /// Unset fields take the value of the protection level's preset.
  std::optional<bool> preserve_formatting;
  std::optional<bool> allow_control_chars;
  std::optional<bool> detect_terminal_manipulation;
  std::optional<std::uint64_t> max_input_length;
  std::optional<std::uint64_t> whitespace_flood_threshold;
  std::vector<CustomPatternConfig> custom_patterns;
};

struct MemorySection {
  /// development, production, testing or audit. Empty keeps the defaults.
  std::string preset;
  std::optional<std::uint64_t> max_object_size;
  std::optional<std::uint64_t> max_array_length;
  std::optional<std::uint64_t> max_property_count;
  std::optional<std::uint64_t> max_nesting_depth;
  std::optional<std::uint64_t> max_calculation_time_ms;
  std::optional<bool> strict_mode;
  std::optional<std::string> protection_level;
  std::optional<std::uint64_t> max_context_size;
  std::optional<std::uint64_t> max_message_length;
  std::optional<std::uint64_t> max_stack_frames;
  std::optional<double> monitoring_sample_rate;
  std::optional<bool> log_violations;
};

struct ValidationSection {
  bool strict_mode = false;
  bool auto_sanitize = false;
  bool allow_path_traversal = false;
  bool allow_absolute_paths = false;
  std::string working_directory;
  std::uint64_t max_arg_length = 10240;
  std::uint64_t max_path_length = 4096;
  std::vector<std::string> allowed_package_managers = {"npm", "pnpm", "yarn", "bun"};
};

struct MonitorSection {
  std::uint64_t alert_threshold = 5;
  std::uint64_t time_window_seconds = 60;
  std::uint64_t max_sources = 1024;
};

struct ObservabilitySection {
  std::string backend = "log";
  bool include_metrics = false;
};

struct Config {
  SanitizationSection sanitization;
  MemorySection memory;
  ValidationSection validation;
  MonitorSection monitor;
  ObservabilitySection observability;
};

} // namespace wardline::config
