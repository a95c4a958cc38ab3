#include "wardline/config/config.hpp"

#include "wardline/common/fs.hpp"
#include "wardline/common/levels.hpp"
#include "wardline/common/toml.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>
#include <vector>

namespace wardline::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".wardline";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("WARDLINE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::optional<bool> optional_bool(const common::TomlDocument &doc, const std::string &key) {
  if (!doc.has(key)) {
    return std::nullopt;
  }
  return doc.get_bool(key, false);
}

std::optional<std::uint64_t> optional_u64(const common::TomlDocument &doc, const std::string &key) {
  if (!doc.has(key)) {
    return std::nullopt;
  }
  return doc.get_u64(key, 0);
}

void load_sanitization_section(Config &config, const common::TomlDocument &doc) {
  auto &section = config.sanitization;
  section.protection_level =
      doc.get_string("sanitization.protection_level", section.protection_level);
  section.preserve_formatting = optional_bool(doc, "sanitization.preserve_formatting");
  section.allow_control_chars = optional_bool(doc, "sanitization.allow_control_chars");
  section.detect_terminal_manipulation =
      optional_bool(doc, "sanitization.detect_terminal_manipulation");
  section.max_input_length = optional_u64(doc, "sanitization.max_input_length");
  section.whitespace_flood_threshold = optional_u64(doc, "sanitization.whitespace_flood_threshold");

  // Tags and severities pair with patterns by position.
  const auto patterns = doc.get_string_array("sanitization.custom_patterns");
  const auto tags = doc.get_string_array("sanitization.custom_pattern_tags");
  const auto severities = doc.get_string_array("sanitization.custom_pattern_severities");
  for (std::size_t i = 0; i < patterns.size(); ++i) {
    CustomPatternConfig pattern;
    pattern.pattern = patterns[i];
    if (i < tags.size()) {
      pattern.tag = tags[i];
    }
    if (i < severities.size()) {
      pattern.severity = severities[i];
    }
    section.custom_patterns.push_back(std::move(pattern));
  }
}

void load_memory_section(Config &config, const common::TomlDocument &doc) {
  auto &section = config.memory;
  section.preset = doc.get_string("memory.preset", section.preset);
  section.max_object_size = optional_u64(doc, "memory.max_object_size");
  section.max_array_length = optional_u64(doc, "memory.max_array_length");
  section.max_property_count = optional_u64(doc, "memory.max_property_count");
  section.max_nesting_depth = optional_u64(doc, "memory.max_nesting_depth");
  section.max_calculation_time_ms = optional_u64(doc, "memory.max_calculation_time_ms");
  section.strict_mode = optional_bool(doc, "memory.strict_mode");
  if (doc.has("memory.protection_level")) {
    section.protection_level = doc.get_string("memory.protection_level");
  }
  section.max_context_size = optional_u64(doc, "memory.max_context_size");
  section.max_message_length = optional_u64(doc, "memory.max_message_length");
  section.max_stack_frames = optional_u64(doc, "memory.max_stack_frames");
  if (doc.has("memory.monitoring_sample_rate")) {
    section.monitoring_sample_rate = doc.get_double("memory.monitoring_sample_rate", 1.0);
  }
  section.log_violations = optional_bool(doc, "memory.log_violations");
}

void load_validation_section(Config &config, const common::TomlDocument &doc) {
  auto &section = config.validation;
  section.strict_mode = doc.get_bool("validation.strict_mode", section.strict_mode);
  section.auto_sanitize = doc.get_bool("validation.auto_sanitize", section.auto_sanitize);
  section.allow_path_traversal =
      doc.get_bool("validation.allow_path_traversal", section.allow_path_traversal);
  section.allow_absolute_paths =
      doc.get_bool("validation.allow_absolute_paths", section.allow_absolute_paths);
  section.working_directory =
      common::expand_path(doc.get_string("validation.working_directory", section.working_directory));
  section.max_arg_length = doc.get_u64("validation.max_arg_length", section.max_arg_length);
  section.max_path_length = doc.get_u64("validation.max_path_length", section.max_path_length);
  section.allowed_package_managers =
      doc.get_string_array("validation.allowed_package_managers", section.allowed_package_managers);
}

void load_monitor_section(Config &config, const common::TomlDocument &doc) {
  auto &section = config.monitor;
  section.alert_threshold = doc.get_u64("monitor.alert_threshold", section.alert_threshold);
  section.time_window_seconds =
      doc.get_u64("monitor.time_window_seconds", section.time_window_seconds);
  section.max_sources = doc.get_u64("monitor.max_sources", section.max_sources);
}

Config config_from_document(const common::TomlDocument &doc) {
  Config config;
  load_sanitization_section(config, doc);
  load_memory_section(config, doc);
  load_validation_section(config, doc);
  load_monitor_section(config, doc);
  config.observability.backend = doc.get_string("observability.backend", config.observability.backend);
  config.observability.include_metrics =
      doc.get_bool("observability.include_metrics", config.observability.include_metrics);
  return config;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

template <typename T>
void write_optional(std::ostringstream &out, const char *key, const std::optional<T> &value) {
  if (!value.has_value()) {
    return;
  }
  if constexpr (std::is_same_v<T, bool>) {
    out << key << " = " << bool_to_toml(*value) << "\n";
  } else if constexpr (std::is_same_v<T, std::string>) {
    out << key << " = " << common::quote_toml_string(*value) << "\n";
  } else {
    out << key << " = " << *value << "\n";
  }
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *level = std::getenv("WARDLINE_PROTECTION_LEVEL"); level != nullptr && *level) {
    config.sanitization.protection_level = level;
  }
  if (const char *preset = std::getenv("WARDLINE_MEMORY_PRESET"); preset != nullptr && *preset) {
    config.memory.preset = preset;
  }
  if (const char *backend = std::getenv("WARDLINE_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> load_config_from_string(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  Config config = config_from_document(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto loaded = load_config_from_string(buffer.str());
  if (!loaded.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + loaded.error());
  }
  return loaded;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  const auto &sanitization = config.sanitization;
  out << "[sanitization]\n";
  out << "protection_level = " << common::quote_toml_string(sanitization.protection_level) << "\n";
  write_optional(out, "preserve_formatting", sanitization.preserve_formatting);
  write_optional(out, "allow_control_chars", sanitization.allow_control_chars);
  write_optional(out, "detect_terminal_manipulation", sanitization.detect_terminal_manipulation);
  write_optional(out, "max_input_length", sanitization.max_input_length);
  write_optional(out, "whitespace_flood_threshold", sanitization.whitespace_flood_threshold);
  if (!sanitization.custom_patterns.empty()) {
    std::vector<std::string> patterns;
    std::vector<std::string> tags;
    std::vector<std::string> severities;
    for (const auto &pattern : sanitization.custom_patterns) {
      patterns.push_back(pattern.pattern);
      tags.push_back(pattern.tag);
      severities.push_back(pattern.severity);
    }
    out << "custom_patterns = " << string_array_to_toml(patterns) << "\n";
    out << "custom_pattern_tags = " << string_array_to_toml(tags) << "\n";
    out << "custom_pattern_severities = " << string_array_to_toml(severities) << "\n";
  }

  const auto &memory = config.memory;
  out << "\n[memory]\n";
  if (!memory.preset.empty()) {
    out << "preset = " << common::quote_toml_string(memory.preset) << "\n";
  }
  write_optional(out, "max_object_size", memory.max_object_size);
  write_optional(out, "max_array_length", memory.max_array_length);
  write_optional(out, "max_property_count", memory.max_property_count);
  write_optional(out, "max_nesting_depth", memory.max_nesting_depth);
  write_optional(out, "max_calculation_time_ms", memory.max_calculation_time_ms);
  write_optional(out, "strict_mode", memory.strict_mode);
  write_optional(out, "protection_level", memory.protection_level);
  write_optional(out, "max_context_size", memory.max_context_size);
  write_optional(out, "max_message_length", memory.max_message_length);
  write_optional(out, "max_stack_frames", memory.max_stack_frames);
  write_optional(out, "monitoring_sample_rate", memory.monitoring_sample_rate);
  write_optional(out, "log_violations", memory.log_violations);

  const auto &validation = config.validation;
  out << "\n[validation]\n";
  out << "strict_mode = " << bool_to_toml(validation.strict_mode) << "\n";
  out << "auto_sanitize = " << bool_to_toml(validation.auto_sanitize) << "\n";
  out << "allow_path_traversal = " << bool_to_toml(validation.allow_path_traversal) << "\n";
  out << "allow_absolute_paths = " << bool_to_toml(validation.allow_absolute_paths) << "\n";
  if (!validation.working_directory.empty()) {
    out << "working_directory = " << common::quote_toml_string(validation.working_directory)
        << "\n";
  }
  out << "max_arg_length = " << validation.max_arg_length << "\n";
  out << "max_path_length = " << validation.max_path_length << "\n";
  out << "allowed_package_managers = " << string_array_to_toml(validation.allowed_package_managers)
      << "\n";

  out << "\n[monitor]\n";
  out << "alert_threshold = " << config.monitor.alert_threshold << "\n";
  out << "time_window_seconds = " << config.monitor.time_window_seconds << "\n";
  out << "max_sources = " << config.monitor.max_sources << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "include_metrics = " << bool_to_toml(config.observability.include_metrics) << "\n";
  return out.str();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const auto sanitization = to_sanitization_config(config);
  if (!sanitization.ok()) {
    return common::Result<std::vector<std::string>>::failure(sanitization.error());
  }
  if (config.sanitization.max_input_length.has_value() &&
      *config.sanitization.max_input_length == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "sanitization.max_input_length must be greater than 0");
  }
  if (config.sanitization.whitespace_flood_threshold.has_value() &&
      *config.sanitization.whitespace_flood_threshold == 0) {
    warnings.push_back("sanitization.whitespace_flood_threshold = 0 disables flood detection");
  }

  const auto memory = to_memory_config(config);
  if (!memory.ok()) {
    return common::Result<std::vector<std::string>>::failure(memory.error());
  }
  const auto &limits = memory.value();
  if (limits.max_object_size == 0 || limits.max_array_length == 0 ||
      limits.max_property_count == 0 || limits.max_nesting_depth == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "memory ceilings (max_object_size, max_array_length, max_property_count, "
        "max_nesting_depth) must be greater than 0");
  }
  if (limits.max_message_length == 0 || limits.max_context_size == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "memory.max_message_length and memory.max_context_size must be greater than 0");
  }
  if (limits.monitoring_sample_rate < 0.0 || limits.monitoring_sample_rate > 1.0) {
    return common::Result<std::vector<std::string>>::failure(
        "memory.monitoring_sample_rate must be between 0.0 and 1.0");
  }
  if (limits.max_calculation_time.count() == 0) {
    warnings.push_back("memory.max_calculation_time_ms = 0 aborts every estimate with a timeout");
  }
  if (limits.max_object_size > 100ULL * 1024 * 1024) {
    warnings.push_back("memory.max_object_size above 100 MB offers little protection");
  }

  if (config.validation.allowed_package_managers.empty()) {
    warnings.push_back("validation.allowed_package_managers is empty; every package manager will "
                       "fall back to npm");
  }
  if (config.validation.allow_path_traversal && config.validation.working_directory.empty()) {
    warnings.push_back("validation.allow_path_traversal without working_directory confines paths "
                       "to the current directory");
  }

  if (config.monitor.alert_threshold == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "monitor.alert_threshold must be greater than 0");
  }
  if (config.monitor.time_window_seconds == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "monitor.time_window_seconds must be greater than 0");
  }
  if (config.monitor.max_sources == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "monitor.max_sources must be greater than 0");
  }

  for (const auto &backend : common::split(config.observability.backend, ',')) {
    const std::string name = common::to_lower(common::trim(backend));
    if (name != "log" && name != "none" && name != "noop") {
      warnings.push_back("Unknown observability backend '" + name + "'; falling back to log");
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

common::Result<security::SanitizationConfig> to_sanitization_config(const Config &config) {
  const auto &section = config.sanitization;
  const auto level = common::parse_protection_level(section.protection_level);
  if (!level.has_value()) {
    return common::Result<security::SanitizationConfig>::failure(
        "Invalid sanitization.protection_level: " + section.protection_level);
  }

  security::SanitizationConfig out = security::sanitization_preset(*level);
  out.preserve_formatting = section.preserve_formatting.value_or(out.preserve_formatting);
  out.allow_control_chars = section.allow_control_chars.value_or(out.allow_control_chars);
  out.detect_terminal_manipulation =
      section.detect_terminal_manipulation.value_or(out.detect_terminal_manipulation);
  if (section.max_input_length.has_value()) {
    out.max_input_length = static_cast<std::size_t>(*section.max_input_length);
  }
  if (section.whitespace_flood_threshold.has_value()) {
    out.whitespace_flood_threshold = static_cast<std::size_t>(*section.whitespace_flood_threshold);
  }

  for (const auto &pattern : section.custom_patterns) {
    const auto severity = common::parse_severity(pattern.severity);
    if (!severity.has_value()) {
      return common::Result<security::SanitizationConfig>::failure(
          "Invalid custom pattern severity: " + pattern.severity);
    }
    auto compiled = security::compile_custom_pattern(pattern.pattern, pattern.tag, *severity);
    if (!compiled.ok()) {
      return common::Result<security::SanitizationConfig>::failure(compiled.error());
    }
    out.custom_patterns.push_back(std::move(compiled.value()));
  }
  return common::Result<security::SanitizationConfig>::success(std::move(out));
}

common::Result<memory::MemoryConfig> to_memory_config(const Config &config) {
  const auto &section = config.memory;
  memory::MemoryConfig out;
  if (!section.preset.empty()) {
    const auto preset = memory::parse_memory_preset(section.preset);
    if (!preset.has_value()) {
      return common::Result<memory::MemoryConfig>::failure("Invalid memory.preset: " +
                                                           section.preset);
    }
    out = memory::memory_preset(*preset);
  }

  out.max_object_size = section.max_object_size.value_or(out.max_object_size);
  out.max_array_length = section.max_array_length.value_or(out.max_array_length);
  out.max_property_count = section.max_property_count.value_or(out.max_property_count);
  if (section.max_nesting_depth.has_value()) {
    out.max_nesting_depth = static_cast<std::uint32_t>(*section.max_nesting_depth);
  }
  if (section.max_calculation_time_ms.has_value()) {
    out.max_calculation_time = std::chrono::milliseconds(*section.max_calculation_time_ms);
  }
  out.strict_mode = section.strict_mode.value_or(out.strict_mode);
  if (section.protection_level.has_value()) {
    const auto level = common::parse_protection_level(*section.protection_level);
    if (!level.has_value()) {
      return common::Result<memory::MemoryConfig>::failure("Invalid memory.protection_level: " +
                                                           *section.protection_level);
    }
    out.protection_level = *level;
  }
  out.max_context_size = section.max_context_size.value_or(out.max_context_size);
  out.max_message_length = section.max_message_length.value_or(out.max_message_length);
  if (section.max_stack_frames.has_value()) {
    out.max_stack_frames = static_cast<std::uint32_t>(*section.max_stack_frames);
  }
  out.monitoring_sample_rate = section.monitoring_sample_rate.value_or(out.monitoring_sample_rate);
  out.log_violations = section.log_violations.value_or(out.log_violations);
  return common::Result<memory::MemoryConfig>::success(out);
}

validation::ValidationConfig to_validation_config(const Config &config) {
  const auto &section = config.validation;
  validation::ValidationConfig out;
  out.strict_mode = section.strict_mode;
  out.auto_sanitize = section.auto_sanitize;
  out.allow_path_traversal = section.allow_path_traversal;
  out.allow_absolute_paths = section.allow_absolute_paths;
  out.working_directory = section.working_directory;
  out.max_arg_length = static_cast<std::size_t>(section.max_arg_length);
  out.max_path_length = static_cast<std::size_t>(section.max_path_length);
  out.allowed_package_managers = section.allowed_package_managers;
  return out;
}

common::Result<security::MonitorConfig> to_monitor_config(const Config &config) {
  auto sanitization = to_sanitization_config(config);
  if (!sanitization.ok()) {
    return common::Result<security::MonitorConfig>::failure(sanitization.error());
  }
  security::MonitorConfig out;
  out.alert_threshold = static_cast<std::size_t>(config.monitor.alert_threshold);
  out.time_window = std::chrono::seconds(config.monitor.time_window_seconds);
  out.max_sources = static_cast<std::size_t>(config.monitor.max_sources);
  out.sanitization = std::move(sanitization.value());
  return common::Result<security::MonitorConfig>::success(std::move(out));
}

} // namespace wardline::config
