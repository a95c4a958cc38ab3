#include "wardline/cli/commands.hpp"

#include "wardline/common/fs.hpp"
#include "wardline/config/config.hpp"
#include "wardline/memory/protection_manager.hpp"
#include "wardline/observability/factory.hpp"
#include "wardline/observability/global.hpp"
#include "wardline/security/log_monitor.hpp"
#include "wardline/security/threat_detector.hpp"
#include "wardline/validation/input_validator.hpp"

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace wardline::cli {

namespace {

std::string version_string() {
#ifdef WARDLINE_VERSION
  std::string version = WARDLINE_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "wardline " + version;
}

struct Streams {
  std::istream &in;
  std::ostream &out;
  std::ostream &err;
};

/// Installs the configured observer for the duration of one command.
class ObserverScope {
public:
  ObserverScope(const config::Config &config, std::ostream &err) {
    observability::set_global_observer(observability::create_observer(config, err));
  }
  ~ObserverScope() {
    if (auto *observer = observability::get_global_observer(); observer != nullptr) {
      observer->flush();
    }
    observability::set_global_observer(nullptr);
  }
  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;
};

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_all(std::istream &in) {
  std::ostringstream out;
  out << in.rdbuf();
  std::string text = out.str();
  if (!text.empty() && text.back() == '\n') {
    text.pop_back();
    if (!text.empty() && text.back() == '\r') {
      text.pop_back();
    }
  }
  return text;
}

std::string input_text(const std::vector<std::string> &args, std::istream &in) {
  if (args.empty() || (args.size() == 1 && args[0] == "-")) {
    return read_all(in);
  }
  return join_tokens(args);
}

/// Escapes every byte outside printable ASCII so reports never echo raw
/// control sequences.
std::string printable(const std::string_view text) {
  static constexpr char HEX[] = "0123456789abcdef";
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte == '\\') {
      out += "\\\\";
    } else if (byte >= 0x20 && byte < 0x7F) {
      out.push_back(ch);
    } else {
      out += "\\x";
      out.push_back(HEX[byte >> 4]);
      out.push_back(HEX[byte & 0x0F]);
    }
  }
  return out;
}

std::string join_names(const std::vector<std::string> &names) {
  std::string out;
  for (const auto &name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out.empty() ? "none" : out;
}

void print_analysis(const security::RiskAnalysis &analysis, std::ostream &out) {
  out << "risk_score: " << analysis.risk_score << "\n";
  out << "risk_level: " << security::risk_level_name(analysis.risk_level) << "\n";

  std::vector<std::string> categories;
  for (const auto category : analysis.threat_categories) {
    categories.emplace_back(security::category_name(category));
  }
  std::vector<std::string> vectors;
  for (const auto vector : analysis.attack_vectors) {
    vectors.emplace_back(security::attack_vector_name(vector));
  }
  out << "categories: " << join_names(categories) << "\n";
  out << "attack_vectors: " << join_names(vectors) << "\n";
  out << "violations: " << analysis.total_violations() << "\n";
  for (const auto &violation : analysis.violations) {
    out << "  " << common::severity_name(violation.severity) << " "
        << security::category_name(violation.category) << " @" << violation.offset;
    if (!violation.replacement_tag.empty()) {
      out << " " << violation.replacement_tag;
    }
    out << " \"" << printable(violation.original_span) << "\"\n";
  }
  if (analysis.suppressed_violations > 0) {
    out << "  (" << analysis.suppressed_violations << " more not recorded)\n";
  }
}

common::Result<security::SanitizationConfig>
sanitization_from_args(const config::Config &cfg, std::vector<std::string> &args) {
  config::Config effective = cfg;
  std::string level;
  if (take_option(args, "--level", "-l", level)) {
    effective.sanitization.protection_level = level;
    // A level given on the command line selects the whole preset.
    effective.sanitization.max_input_length.reset();
    effective.sanitization.whitespace_flood_threshold.reset();
    effective.sanitization.preserve_formatting.reset();
  }
  if (take_flag(args, "--preserve-formatting")) {
    effective.sanitization.preserve_formatting = true;
  }
  if (take_flag(args, "--allow-control-chars")) {
    effective.sanitization.allow_control_chars = true;
  }
  std::string pattern;
  while (take_option(args, "--pattern", "-p", pattern)) {
    effective.sanitization.custom_patterns.push_back(config::CustomPatternConfig{pattern, "", "medium"});
  }
  return config::to_sanitization_config(effective);
}

int run_sanitize(const config::Config &cfg, std::vector<std::string> args, const Streams &io) {
  const bool report = take_flag(args, "--report");
  auto sanitization = sanitization_from_args(cfg, args);
  if (!sanitization.ok()) {
    io.err << sanitization.error() << "\n";
    return 1;
  }
  const auto result = security::scan(input_text(args, io.in), sanitization.value());
  io.out << result.sanitized << "\n";
  if (report) {
    print_analysis(result.analysis, io.err);
  }
  return 0;
}

int run_analyze(const config::Config &cfg, std::vector<std::string> args, const Streams &io) {
  const bool log_mode = take_flag(args, "--log");
  std::string fail_on;
  const bool has_fail_on = take_option(args, "--fail-on", "", fail_on);
  auto sanitization = sanitization_from_args(cfg, args);
  if (!sanitization.ok()) {
    io.err << sanitization.error() << "\n";
    return 1;
  }
  std::optional<common::Severity> threshold;
  if (has_fail_on) {
    threshold = common::parse_severity(fail_on);
    if (!threshold.has_value()) {
      io.err << "invalid --fail-on severity: " << fail_on << "\n";
      return 1;
    }
  }

  const std::string text = input_text(args, io.in);
  security::RiskAnalysis analysis;
  if (log_mode) {
    auto report = security::analyze_log_security(text, sanitization.value());
    analysis = std::move(report.analysis);
    print_analysis(analysis, io.out);
    for (const auto &warning : report.warnings) {
      io.out << "warning: " << warning << "\n";
    }
  } else {
    analysis = security::analyze(text, sanitization.value());
    print_analysis(analysis, io.out);
  }

  if (threshold.has_value()) {
    for (const auto &violation : analysis.violations) {
      if (violation.severity >= *threshold) {
        return 3;
      }
    }
  }
  return 0;
}

int run_validate(const config::Config &cfg, std::vector<std::string> args, const Streams &io) {
  validation::ValidationConfig validation = config::to_validation_config(cfg);
  if (take_flag(args, "--auto-sanitize")) {
    validation.auto_sanitize = true;
  }
  if (take_flag(args, "--allow-absolute")) {
    validation.allow_absolute_paths = true;
  }
  std::string working_directory;
  if (take_option(args, "--cwd", "", working_directory)) {
    validation.working_directory = common::expand_path(working_directory);
  }

  if (args.empty()) {
    io.err << "usage: wardline validate <project-name|package-manager|path|command-arg> <value>\n";
    return 1;
  }
  const auto kind = validation::parse_input_kind(args[0]);
  if (!kind.has_value()) {
    io.err << "unknown input kind: " << printable(args[0]) << "\n";
    return 1;
  }
  args.erase(args.begin());
  const std::string value = input_text(args, io.in);

  const validation::ValidationResult result = validation::validate_input(*kind, value, validation);

  io.out << (result.is_valid ? "valid" : "invalid") << "\n";
  io.out << "sanitized: " << printable(result.sanitized) << "\n";
  io.out << "risk_score: " << result.risk_score << "\n";
  for (const auto &error : result.errors) {
    io.out << "error: " << printable(error) << "\n";
  }
  for (const auto &suggestion : result.suggestions) {
    io.out << "suggestion: " << printable(suggestion) << "\n";
  }
  return result.is_valid ? 0 : 2;
}

int run_size(const config::Config &cfg, std::vector<std::string> args, const Streams &io) {
  auto limits = config::to_memory_config(cfg);
  if (!limits.ok()) {
    io.err << limits.error() << "\n";
    return 1;
  }
  memory::MemoryConfig memory_config = limits.value();
  std::string preset;
  if (take_option(args, "--preset", "", preset)) {
    const auto parsed = memory::parse_memory_preset(preset);
    if (!parsed.has_value()) {
      io.err << "unknown memory preset: " << printable(preset) << "\n";
      return 1;
    }
    memory_config = memory::memory_preset(*parsed);
  }
  memory_config.strict_mode = false;

  memory::MemoryProtectionManager manager(memory_config);
  const auto analysis =
      manager.validate_object_size(memory::Value::string(input_text(args, io.in)), "cli-input");

  io.out << "estimated_bytes: " << analysis.estimated_bytes << "\n";
  io.out << "limit_bytes: " << memory_config.max_object_size << "\n";
  io.out << "usage_level: " << memory::usage_level_name(analysis.usage_level) << "\n";
  io.out << "security_score: " << analysis.security_score << "\n";
  io.out << "performance_impact: " << memory::performance_impact_name(analysis.performance_impact)
         << "\n";
  for (const auto &violation : analysis.violations) {
    io.out << "violation: " << memory::memory_violation_kind_name(violation.kind) << " "
           << common::severity_name(violation.severity) << " " << violation.actual_size << " > "
           << violation.allowed_size << "\n";
  }
  for (const auto &recommendation : analysis.recommendations) {
    io.out << "recommendation: " << recommendation << "\n";
  }
  return analysis.usage_level == memory::UsageLevel::Exceeded ? 2 : 0;
}

int run_monitor(const config::Config &cfg, std::vector<std::string> args, const Streams &io) {
  auto monitor_config = config::to_monitor_config(cfg);
  if (!monitor_config.ok()) {
    io.err << monitor_config.error() << "\n";
    return 1;
  }
  std::string source = "stdin";
  take_option(args, "--source", "-s", source);
  std::string threshold;
  if (take_option(args, "--threshold", "", threshold)) {
    try {
      monitor_config.value().alert_threshold = static_cast<std::size_t>(std::stoull(threshold));
    } catch (const std::exception &) {
      io.err << "invalid --threshold: " << printable(threshold) << "\n";
      return 1;
    }
  }
  const bool echo = take_flag(args, "--echo");

  std::ostream &out = io.out;
  monitor_config.value().on_alert = [&out](const security::SecurityAlert &alert) {
    out << "ALERT " << alert.id << " severity=" << common::severity_name(alert.severity)
        << " source=" << alert.source << " violations=" << alert.violations.size() << "\n";
  };
  const security::SanitizationConfig echo_config = monitor_config.value().sanitization;
  security::LogSecurityMonitor monitor(std::move(monitor_config.value()));

  std::string line;
  while (std::getline(io.in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    (void)monitor.monitor_message(line, source);
    if (echo) {
      io.out << security::sanitize(line, echo_config) << "\n";
    }
  }

  const auto stats = monitor.get_stats();
  io.out << "messages: " << stats.messages_processed << "\n";
  io.out << "messages_with_violations: " << stats.messages_with_violations << "\n";
  io.out << "violations: " << stats.total_violations << "\n";
  io.out << "alerts: " << stats.alerts_raised << "\n";
  return 0;
}

int run_config(const config::Config &cfg, std::vector<std::string> args, const Streams &io) {
  if (args.empty() || args[0] == "show") {
    io.out << config::render_config(cfg);
    return 0;
  }
  if (args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      io.err << path_result.error() << "\n";
      return 1;
    }
    io.out << path_result.value().string() << "\n";
    return 0;
  }
  if (args[0] == "validate") {
    const auto checked = config::validate_config(cfg);
    if (!checked.ok()) {
      io.err << "invalid config: " << checked.error() << "\n";
      return 1;
    }
    for (const auto &warning : checked.value()) {
      io.out << "warning: " << warning << "\n";
    }
    io.out << "config ok\n";
    return 0;
  }
  io.err << "unknown config command\n";
  return 1;
}

} // namespace

void print_help(std::ostream &out) {
  out << version_string() << "\n\n";
  out << "USAGE\n";
  out << "  wardline [--config PATH] <command> [options] [TEXT...]\n\n";
  out << "TEXT COMMANDS (read stdin when TEXT is omitted or '-')\n";
  out << "  sanitize      Print the sanitized text (--report lists violations on stderr)\n";
  out << "  analyze       Print the risk analysis (--log, --fail-on SEVERITY)\n";
  out << "  monitor       Track violations per source over stdin lines (--source, --threshold)\n";
  out << "  size          Estimate the in-memory size of the text (--preset)\n\n";
  out << "  Shared options: --level permissive|standard|strict, --preserve-formatting,\n";
  out << "                  --allow-control-chars, --pattern REGEX\n\n";
  out << "VALIDATION\n";
  out << "  validate <project-name|package-manager|path|command-arg> VALUE\n";
  out << "                [--auto-sanitize] [--allow-absolute] [--cwd DIR]\n\n";
  out << "OTHER\n";
  out << "  config show|path|validate\n";
  out << "  version\n";
  out << "  help\n";
}

int run_cli(std::vector<std::string> args, std::istream &in, std::ostream &out, std::ostream &err) {
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    err << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help(out);
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(out);
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    out << version_string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    err << cfg.error() << "\n";
    return 1;
  }
  const Streams io{in, out, err};
  if (subcommand == "config") {
    return run_config(cfg.value(), std::move(args), io);
  }

  const auto checked = config::validate_config(cfg.value());
  if (!checked.ok()) {
    err << "invalid config: " << checked.error() << "\n";
    return 1;
  }

  ObserverScope observer_scope(cfg.value(), err);
  if (subcommand == "sanitize") {
    return run_sanitize(cfg.value(), std::move(args), io);
  }
  if (subcommand == "analyze") {
    return run_analyze(cfg.value(), std::move(args), io);
  }
  if (subcommand == "validate") {
    return run_validate(cfg.value(), std::move(args), io);
  }
  if (subcommand == "size") {
    return run_size(cfg.value(), std::move(args), io);
  }
  if (subcommand == "monitor") {
    return run_monitor(cfg.value(), std::move(args), io);
  }

  err << "Unknown command: " << printable(subcommand) << "\n";
  print_help(err);
  return 1;
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help(std::cout);
    return 0;
  }
  return run_cli(collect_args(argc - 1, argv + 1), std::cin, std::cout, std::cerr);
}

} // namespace wardline::cli
