#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "wardline/config/config.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace {

// Keeps ambient WARDLINE_* variables from leaking into config loading.
struct CleanEnv {
  wardline::testing::EnvGuard level{"WARDLINE_PROTECTION_LEVEL", std::nullopt};
  wardline::testing::EnvGuard preset{"WARDLINE_MEMORY_PRESET", std::nullopt};
  wardline::testing::EnvGuard backend{"WARDLINE_OBSERVABILITY", std::nullopt};
  wardline::testing::EnvGuard path{"WARDLINE_CONFIG_PATH", std::nullopt};
};

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  for (const auto &warning : warnings) {
    if (warning.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_config_tests(std::vector<wardline::tests::TestCase> &tests) {
  using wardline::tests::require;
  namespace cfg = wardline::config;
  namespace testing = wardline::testing;
  namespace sec = wardline::security;

  tests.push_back({"config_path_defaults_to_home", [] {
                     const CleanEnv env;
                     const testing::TempWorkspace home;
                     const testing::EnvGuard env_home("HOME", home.path().string());
                     const testing::ConfigOverrideGuard guard;
                     cfg::clear_config_path_override();

                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == home.path() / ".wardline" / "config.toml",
                             "unexpected path " + path.value().string());
                     require(!cfg::config_path_override().has_value(), "no override expected");
                   }});

  tests.push_back({"config_path_env_and_override_precedence", [] {
                     const CleanEnv env;
                     const testing::TempWorkspace workspace;
                     const testing::ConfigOverrideGuard guard;
                     const testing::EnvGuard env_path("WARDLINE_CONFIG_PATH",
                                                      workspace.path().string());

                     const auto from_env = cfg::config_path();
                     require(from_env.ok(), from_env.error());
                     require(from_env.value() == workspace.path() / "config.toml",
                             "directory should resolve to config.toml inside it");

                     const auto explicit_file = workspace.path() / "custom.toml";
                     cfg::set_config_path_override(explicit_file);
                     const auto overridden = cfg::config_path();
                     require(overridden.ok() && overridden.value() == explicit_file,
                             "override should win over the environment");
                   }});

  tests.push_back({"config_missing_file_returns_defaults", [] {
                     const CleanEnv env;
                     const testing::TempWorkspace workspace;
                     const testing::ConfigOverrideGuard guard;
                     cfg::set_config_path_override(workspace.path() / "missing.toml");

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.sanitization.protection_level == "standard", "default level");
                     require(!config.sanitization.max_input_length.has_value(),
                             "unset overrides stay empty");
                     require(config.memory.preset.empty(), "no preset by default");
                     require(config.monitor.alert_threshold == 5, "default threshold");
                     require(config.observability.backend == "log", "default backend");
                     require(config.validation.allowed_package_managers.size() == 4,
                             "default package managers");
                   }});

  tests.push_back({"config_load_valid_toml", [] {
                     const CleanEnv env;
                     const testing::TempWorkspace workspace;
                     const testing::ConfigOverrideGuard guard;
                     const auto file = workspace.create_file("config.toml", R"(
[sanitization]
protection_level = "strict"
preserve_formatting = true
max_input_length = 4_096
custom_patterns = ["secret-\\d+", "api_key=\\w+"]
custom_pattern_tags = ["[SECRET]"]
custom_pattern_severities = ["high", "critical"]

[memory]
preset = "production"
max_object_size = 2048
monitoring_sample_rate = 0.5
protection_level = "permissive"

[validation]
auto_sanitize = true
allowed_package_managers = ["npm", "yarn"]

[monitor]
alert_threshold = 2
time_window_seconds = 30

[observability]
backend = "none"
include_metrics = true
)");
                     cfg::set_config_path_override(file);

                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     const auto &config = loaded.value();
                     require(config.sanitization.protection_level == "strict", "level mismatch");
                     require(config.sanitization.preserve_formatting == true, "formatting flag");
                     require(config.sanitization.max_input_length == 4096u, "input length");
                     require(config.sanitization.custom_patterns.size() == 2, "two patterns");
                     require(config.sanitization.custom_patterns[0].pattern == "secret-\\d+",
                             "pattern text unescaped");
                     require(config.sanitization.custom_patterns[0].tag == "[SECRET]", "tag paired");
                     require(config.sanitization.custom_patterns[1].tag.empty(),
                             "missing tag stays empty");
                     require(config.sanitization.custom_patterns[1].severity == "critical",
                             "severity paired");
                     require(config.memory.preset == "production", "preset");
                     require(config.memory.max_object_size == 2048u, "object size");
                     require(config.memory.monitoring_sample_rate == 0.5, "sample rate");
                     require(config.validation.auto_sanitize, "auto sanitize");
                     require(config.validation.allowed_package_managers.size() == 2, "managers");
                     require(config.monitor.alert_threshold == 2, "threshold");
                     require(config.observability.backend == "none", "backend");
                     require(config.observability.include_metrics, "metrics flag");
                   }});

  tests.push_back({"config_parse_error_names_file", [] {
                     const CleanEnv env;
                     const testing::TempWorkspace workspace;
                     const testing::ConfigOverrideGuard guard;
                     const auto file = workspace.create_file("broken.toml", "[monitor]\nthreshold\n");
                     cfg::set_config_path_override(file);

                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "broken file should fail");
                     require(loaded.error().find(file.string()) != std::string::npos,
                             "error should name the file");
                     require(loaded.error().find("line 2") != std::string::npos,
                             "error should name the line");
                   }});

  tests.push_back({"config_env_overrides", [] {
                     const CleanEnv env;
                     const testing::EnvGuard level("WARDLINE_PROTECTION_LEVEL", "permissive");
                     const testing::EnvGuard preset("WARDLINE_MEMORY_PRESET", "audit");
                     const testing::EnvGuard backend("WARDLINE_OBSERVABILITY", "none");

                     const auto loaded = cfg::load_config_from_string(
                         "[sanitization]\nprotection_level = \"strict\"\n");
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().sanitization.protection_level == "permissive",
                             "environment should win over the file");
                     require(loaded.value().memory.preset == "audit", "preset from env");
                     require(loaded.value().observability.backend == "none", "backend from env");
                   }});

  tests.push_back({"config_validate_rejects_fatal_settings", [] {
                     const CleanEnv env;
                     const auto expect_failure = [](cfg::Config config, const std::string &needle) {
                       const auto result = cfg::validate_config(config);
                       require(!result.ok(), "expected failure for " + needle);
                       require(result.error().find(needle) != std::string::npos,
                               "error '" + result.error() + "' should mention " + needle);
                     };

                     cfg::Config level;
                     level.sanitization.protection_level = "paranoid";
                     expect_failure(level, "protection_level");

                     cfg::Config severity;
                     severity.sanitization.custom_patterns.push_back({"x+", "", "urgent"});
                     expect_failure(severity, "severity");

                     cfg::Config regex;
                     regex.sanitization.custom_patterns.push_back({"(", "", "low"});
                     expect_failure(regex, "invalid custom pattern");

                     cfg::Config input;
                     input.sanitization.max_input_length = 0;
                     expect_failure(input, "max_input_length");

                     cfg::Config preset;
                     preset.memory.preset = "staging";
                     expect_failure(preset, "memory.preset");

                     cfg::Config empty_budget;
                     empty_budget.memory.max_object_size = 0;
                     expect_failure(empty_budget, "max_object_size");

                     cfg::Config ceiling;
                     ceiling.memory.max_nesting_depth = 0;
                     expect_failure(ceiling, "memory ceilings");

                     cfg::Config message;
                     message.memory.max_message_length = 0;
                     expect_failure(message, "max_message_length");

                     cfg::Config rate;
                     rate.memory.monitoring_sample_rate = 1.5;
                     expect_failure(rate, "monitoring_sample_rate");

                     cfg::Config threshold;
                     threshold.monitor.alert_threshold = 0;
                     expect_failure(threshold, "alert_threshold");

                     cfg::Config window;
                     window.monitor.time_window_seconds = 0;
                     expect_failure(window, "time_window_seconds");
                   }});

  tests.push_back({"config_validate_reports_warnings", [] {
                     const CleanEnv env;
                     const auto clean = cfg::validate_config(cfg::Config{});
                     require(clean.ok() && clean.value().empty(), "defaults have no warnings");

                     cfg::Config config;
                     config.sanitization.whitespace_flood_threshold = 0;
                     config.memory.max_calculation_time_ms = 0;
                     config.validation.allowed_package_managers.clear();
                     config.validation.allow_path_traversal = true;
                     config.observability.backend = "log,statsd";
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     const auto &warnings = result.value();
                     require(warnings.size() == 5,
                             "expected five warnings, got " + std::to_string(warnings.size()));
                     require(has_warning(warnings, "disables flood detection"), "flood warning");
                     require(has_warning(warnings, "timeout"), "calculation time warning");
                     require(has_warning(warnings, "fall back to npm"), "package manager warning");
                     require(has_warning(warnings, "working_directory"), "traversal warning");
                     require(has_warning(warnings,
                                         "Unknown observability backend 'statsd'; falling back to log"),
                             "backend warning");
                   }});

  tests.push_back({"config_converters_apply_presets_then_overrides", [] {
                     const CleanEnv env;
                     cfg::Config config;
                     config.sanitization.protection_level = "strict";
                     config.sanitization.preserve_formatting = true;
                     config.sanitization.custom_patterns.push_back({"tok-\\d+", "[TOKEN]", "high"});
                     config.memory.preset = "audit";
                     config.memory.max_object_size = 9000;
                     config.memory.max_calculation_time_ms = 250;
                     config.monitor.alert_threshold = 4;
                     config.monitor.time_window_seconds = 15;
                     config.validation.allow_absolute_paths = true;
                     config.validation.max_arg_length = 64;

                     const auto sanitization = cfg::to_sanitization_config(config);
                     require(sanitization.ok(), sanitization.error());
                     require(sanitization.value().protection_level == sec::ProtectionLevel::Strict,
                             "strict level");
                     require(sanitization.value().max_input_length == 1000,
                             "strict preset input length kept");
                     require(sanitization.value().whitespace_flood_threshold == 10,
                             "strict preset flood threshold kept");
                     require(sanitization.value().preserve_formatting, "override applied");
                     require(sanitization.value().custom_patterns.size() == 1 &&
                                 sanitization.value().custom_patterns[0].tag == "[TOKEN]",
                             "custom pattern compiled");

                     const auto memory = cfg::to_memory_config(config);
                     require(memory.ok(), memory.error());
                     require(memory.value().strict_mode, "audit preset is strict");
                     require(memory.value().max_property_count == 25, "audit property count");
                     require(memory.value().max_object_size == 9000, "override wins over preset");
                     require(memory.value().max_calculation_time == std::chrono::milliseconds(250),
                             "calculation time override");

                     const auto monitor = cfg::to_monitor_config(config);
                     require(monitor.ok(), monitor.error());
                     require(monitor.value().alert_threshold == 4, "monitor threshold");
                     require(monitor.value().time_window == std::chrono::seconds(15),
                             "monitor window");
                     require(monitor.value().sanitization.protection_level ==
                                 sec::ProtectionLevel::Strict,
                             "monitor uses the sanitization settings");

                     const auto validation = cfg::to_validation_config(config);
                     require(validation.allow_absolute_paths && validation.max_arg_length == 64,
                             "validation settings copied");
                   }});

  tests.push_back({"config_render_round_trip", [] {
                     const CleanEnv env;
                     cfg::Config config;
                     config.sanitization.protection_level = "permissive";
                     config.sanitization.allow_control_chars = true;
                     config.sanitization.whitespace_flood_threshold = 12;
                     config.sanitization.custom_patterns.push_back({"a\"b", "[Q]", "low"});
                     config.memory.preset = "testing";
                     config.memory.strict_mode = false;
                     config.memory.protection_level = "strict";
                     config.validation.working_directory = "/srv/app";
                     config.monitor.max_sources = 7;
                     config.observability.include_metrics = true;

                     const auto reloaded = cfg::load_config_from_string(cfg::render_config(config));
                     require(reloaded.ok(), reloaded.error());
                     const auto &copy = reloaded.value();
                     require(copy.sanitization.protection_level == "permissive", "level");
                     require(copy.sanitization.allow_control_chars == true, "control flag");
                     require(!copy.sanitization.preserve_formatting.has_value(),
                             "unset override stays unset");
                     require(copy.sanitization.whitespace_flood_threshold == 12u, "threshold");
                     require(copy.sanitization.custom_patterns.size() == 1 &&
                                 copy.sanitization.custom_patterns[0].pattern == "a\"b" &&
                                 copy.sanitization.custom_patterns[0].tag == "[Q]",
                             "custom pattern survives quoting");
                     require(copy.memory.preset == "testing", "preset");
                     require(copy.memory.strict_mode == false, "strict flag");
                     require(copy.memory.protection_level == std::optional<std::string>("strict"),
                             "memory level");
                     require(copy.validation.working_directory == "/srv/app", "working directory");
                     require(copy.monitor.max_sources == 7, "max sources");
                     require(copy.observability.include_metrics, "metrics flag");
                   }});
}
