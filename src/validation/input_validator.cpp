#include "wardline/validation/input_validator.hpp"

#include "wardline/common/fs.hpp"
#include "wardline/common/utf8.hpp"
#include "wardline/security/patterns.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace wardline::validation {

namespace {

using security::Severity;
using security::ThreatCategory;

constexpr std::string_view kShellMetacharacters = ";&|`$(){}[]<>";

bool is_separator(const char c) { return c == '-' || c == '_' || c == '.'; }

bool is_project_name_char(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || is_separator(c);
}

std::string_view fallback_for(const InputKind kind) {
  switch (kind) {
  case InputKind::ProjectName:
    return kDefaultProjectName;
  case InputKind::PackageManager:
    return kDefaultPackageManager;
  case InputKind::Path:
    return kDefaultPath;
  case InputKind::CommandArg:
    return "";
  }
  return "";
}

std::optional<std::string> malformed_reason(const std::string_view raw) {
  if (raw.empty()) {
    return std::string("Input is empty");
  }
  if (raw.find('\0') != std::string_view::npos) {
    return std::string("Input contains NUL bytes");
  }
  std::size_t replaced = 0;
  (void)common::repair_utf8(raw, replaced);
  if (replaced > 0) {
    return std::string("Input is not valid UTF-8");
  }
  return std::nullopt;
}

class ResultBuilder {
public:
  void add(const ThreatCategory category, const Severity severity, const std::string_view span,
           std::string message) {
    analysis_.record(security::make_violation(category, severity, span, 0));
    errors_.push_back(std::move(message));
  }

  void malformed(std::string message) {
    add(ThreatCategory::MalformedInput, Severity::Critical, "", std::move(message));
    malformed_ = true;
  }

  void suggest(std::string suggestion) { suggestions_.push_back(std::move(suggestion)); }

  [[nodiscard]] bool empty() const { return analysis_.total_violations() == 0; }

  [[nodiscard]] bool has_security_violation() const {
    return std::any_of(analysis_.violations.begin(), analysis_.violations.end(),
                       [](const auto &violation) { return violation.severity >= Severity::High; });
  }

  ValidationResult finish(const bool valid, std::string sanitized) {
    ValidationResult result;
    result.is_valid = valid;
    result.sanitized = std::move(sanitized);
    result.violations = std::move(analysis_.violations);
    result.risk_score = malformed_ ? security::kMaxRiskScore : analysis_.risk_score;
    result.suggestions = std::move(suggestions_);
    result.errors = std::move(errors_);
    return result;
  }

private:
  security::RiskAnalysis analysis_;
  std::vector<std::string> suggestions_;
  std::vector<std::string> errors_;
  bool malformed_ = false;
};

void check_project_name_format(const std::string &name, ResultBuilder &builder) {
  if (name.size() < kMinProjectNameLength || name.size() > kMaxProjectNameLength) {
    builder.add(ThreatCategory::MalformedInput, Severity::Low, name,
                "Project name must be between " + std::to_string(kMinProjectNameLength) +
                    " and " + std::to_string(kMaxProjectNameLength) + " characters");
  }
  if (!std::all_of(name.begin(), name.end(), is_project_name_char)) {
    builder.add(ThreatCategory::MalformedInput, Severity::Low, name,
                "Project name may only contain lowercase letters, digits, '-', '_' and '.'");
  }
  if (!name.empty() && (is_separator(name.front()) || is_separator(name.back()))) {
    builder.add(ThreatCategory::MalformedInput, Severity::Low, name,
                "Project name cannot start or end with a separator");
  }
  const auto pair = std::adjacent_find(name.begin(), name.end(), [](const char a, const char b) {
    return is_separator(a) && is_separator(b);
  });
  if (pair != name.end()) {
    builder.add(ThreatCategory::MalformedInput, Severity::Low, name,
                "Project name cannot contain consecutive separators");
  }
}

bool has_line_break(const std::string_view text) {
  return text.find_first_of("\r\n") != std::string_view::npos;
}

std::string quote_if_needed(const std::string &arg) {
  if (arg.find_first_of(" \t") == std::string::npos) {
    return arg;
  }
  std::string quoted = "'";
  for (const char c : arg) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string clean_arg(const std::string_view raw, const std::size_t max_length) {
  std::size_t replaced = 0;
  const std::string repaired = common::repair_utf8(raw, replaced);
  std::string cleaned;
  cleaned.reserve(repaired.size());
  for (const char c : repaired) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte == 0x7F || kShellMetacharacters.find(c) != std::string_view::npos) {
      continue;
    }
    cleaned.push_back(c);
  }
  cleaned.resize(common::utf8_prefix_length(cleaned, max_length));
  return quote_if_needed(cleaned);
}

std::filesystem::path working_root(const ValidationConfig &config) {
  std::error_code ec;
  std::filesystem::path cwd = std::filesystem::current_path(ec);
  if (ec) {
    cwd = "/";
  }
  if (config.working_directory.empty()) {
    return cwd.lexically_normal();
  }
  std::filesystem::path root(common::expand_path(config.working_directory));
  if (root.is_relative()) {
    root = cwd / root;
  }
  return root.lexically_normal();
}

std::string strip_trailing_separator(std::string path) {
  while (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path.empty() ? std::string(kDefaultPath) : path;
}

} // namespace

InputValidationError::InputValidationError(const std::string &message,
                                           std::vector<security::SecurityViolation> violations)
    : std::runtime_error(message), violations_(std::move(violations)) {}

std::string_view input_kind_name(const InputKind kind) {
  switch (kind) {
  case InputKind::ProjectName:
    return "project-name";
  case InputKind::PackageManager:
    return "package-manager";
  case InputKind::Path:
    return "path";
  case InputKind::CommandArg:
    return "command-arg";
  }
  return "project-name";
}

std::optional<InputKind> parse_input_kind(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "project-name" || normalized == "project") {
    return InputKind::ProjectName;
  }
  if (normalized == "package-manager" || normalized == "pm") {
    return InputKind::PackageManager;
  }
  if (normalized == "path") {
    return InputKind::Path;
  }
  if (normalized == "command-arg" || normalized == "arg") {
    return InputKind::CommandArg;
  }
  return std::nullopt;
}

std::string sanitize_project_name(const std::string_view raw) {
  std::string mapped;
  mapped.reserve(raw.size());
  for (const char c : raw) {
    const char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    mapped.push_back(is_project_name_char(lower) ? lower : '-');
  }

  std::string collapsed;
  collapsed.reserve(mapped.size());
  for (const char c : mapped) {
    if (is_separator(c) && !collapsed.empty() && is_separator(collapsed.back())) {
      continue;
    }
    collapsed.push_back(c);
  }

  const auto first = collapsed.find_first_not_of("-_.");
  if (first == std::string::npos) {
    return std::string(kDefaultProjectName);
  }
  std::string trimmed = collapsed.substr(first);
  if (trimmed.size() > kMaxProjectNameLength) {
    trimmed.resize(kMaxProjectNameLength);
  }
  while (!trimmed.empty() && is_separator(trimmed.back())) {
    trimmed.pop_back();
  }
  if (trimmed.size() < kMinProjectNameLength) {
    return std::string(kDefaultProjectName);
  }
  return trimmed;
}

ValidationResult validate_project_name(const std::string_view raw, const ValidationConfig &config) {
  ResultBuilder builder;
  if (const auto reason = malformed_reason(raw); reason.has_value()) {
    builder.malformed(*reason);
    return builder.finish(false, std::string(kDefaultProjectName));
  }

  const std::string name(raw);
  if (security::contains_path_traversal(name) || name.find("..") != std::string::npos) {
    builder.add(ThreatCategory::PathTraversal, Severity::Critical, name,
                "Project name contains a path traversal sequence");
  }
  if (security::contains_shell_metacharacters(name)) {
    builder.add(ThreatCategory::CommandInjection, Severity::High, name,
                "Project name contains shell metacharacters");
  }
  check_project_name_format(name, builder);

  if (builder.empty()) {
    return builder.finish(true, name);
  }

  const std::string candidate = sanitize_project_name(name);
  if (config.auto_sanitize && !builder.has_security_violation()) {
    ValidationConfig recheck = config;
    recheck.auto_sanitize = false;
    if (validate_project_name(candidate, recheck).is_valid) {
      builder.suggest("Using sanitized project name '" + candidate + "'");
      return builder.finish(true, candidate);
    }
  }
  builder.suggest("Try '" + candidate + "'");
  return builder.finish(false, candidate);
}

ValidationResult validate_package_manager(const std::string_view raw,
                                          const ValidationConfig &config) {
  ResultBuilder builder;
  const std::string fallback(kDefaultPackageManager);
  if (const auto reason = malformed_reason(raw); reason.has_value()) {
    builder.malformed(*reason);
    return builder.finish(false, fallback);
  }

  const std::string normalized = common::to_lower(common::trim(std::string(raw)));
  const auto &allowed = config.allowed_package_managers;
  if (std::find(allowed.begin(), allowed.end(), normalized) != allowed.end()) {
    return builder.finish(true, normalized);
  }

  if (security::contains_shell_metacharacters(raw) || !security::is_command_safe(raw) ||
      has_line_break(raw)) {
    builder.add(ThreatCategory::CommandInjection, Severity::Critical, raw,
                "Package manager value contains command injection");
  } else {
    builder.add(ThreatCategory::SuspiciousPattern, Severity::Medium, raw,
                "Unsupported package manager");
  }

  std::string choices;
  for (const auto &name : allowed) {
    choices += choices.empty() ? name : ", " + name;
  }
  builder.suggest("Use one of: " + choices);
  return builder.finish(false, fallback);
}

ValidationResult validate_path(const std::string_view raw, const ValidationConfig &config) {
  ResultBuilder builder;
  const std::string fallback(kDefaultPath);
  if (const auto reason = malformed_reason(raw); reason.has_value()) {
    builder.malformed(*reason);
    return builder.finish(false, fallback);
  }
  if (raw.size() > config.max_path_length) {
    builder.malformed("Path exceeds " + std::to_string(config.max_path_length) + " bytes");
    return builder.finish(false, fallback);
  }

  std::string portable(raw);
  std::replace(portable.begin(), portable.end(), '\\', '/');
  const std::filesystem::path input(portable);

  const bool traversal = security::contains_path_traversal(raw);
  const bool disguised = traversal && security::contains_encoded_path_sequence(raw);
  const bool absolute = security::is_absolute_path(raw) || input.is_absolute();

  if (security::references_sensitive_file(raw)) {
    builder.add(ThreatCategory::SuspiciousPattern, Severity::Critical, raw,
                "Path references a sensitive system file");
  }
  if (raw.find('$') != std::string_view::npos) {
    builder.add(ThreatCategory::CommandInjection, Severity::High, raw,
                "Path contains a variable reference");
  }
  if (traversal && (!config.allow_path_traversal || disguised)) {
    builder.add(ThreatCategory::PathTraversal, Severity::Critical, raw, "Path traversal detected");
  }
  if (absolute && !config.allow_absolute_paths) {
    builder.add(ThreatCategory::PathTraversal, Severity::High, raw,
                "Absolute paths are not allowed");
  }
  if (!builder.empty()) {
    builder.suggest("Use a relative path inside the project directory");
    return builder.finish(false, fallback);
  }

  // Home and drive forms are returned as written; nothing is expanded.
  if (absolute) {
    const std::filesystem::path normal = input.lexically_normal();
    if (traversal && input.is_absolute() && !common::is_subpath(normal, working_root(config))) {
      builder.add(ThreatCategory::PathTraversal, Severity::Critical, raw,
                  "Path escapes working directory");
      return builder.finish(false, fallback);
    }
    return builder.finish(true, strip_trailing_separator(normal.generic_string()));
  }

  const std::filesystem::path root = working_root(config);
  const std::filesystem::path resolved = (root / input).lexically_normal();
  if (traversal && !common::is_subpath(resolved, root)) {
    builder.add(ThreatCategory::PathTraversal, Severity::Critical, raw,
                "Path escapes working directory");
    return builder.finish(false, fallback);
  }
  return builder.finish(true,
                        strip_trailing_separator(resolved.lexically_relative(root).generic_string()));
}

common::Result<std::string> sanitize_path(const std::string_view raw,
                                          const ValidationConfig &config) {
  ValidationResult result = validate_path(raw, config);
  if (!result.is_valid) {
    return common::Result<std::string>::failure(result.errors.empty() ? "Invalid path"
                                                                      : result.errors.front());
  }
  return common::Result<std::string>::success(std::move(result.sanitized));
}

ValidationResult validate_command_arg(const std::string_view raw, const ValidationConfig &config) {
  ResultBuilder builder;
  if (const auto reason = malformed_reason(raw); reason.has_value()) {
    builder.malformed(*reason);
    return builder.finish(false, "");
  }

  if (raw.size() > config.max_arg_length) {
    builder.add(ThreatCategory::SuspiciousPattern, Severity::Medium, raw,
                "Argument exceeds " + std::to_string(config.max_arg_length) + " bytes");
  }
  if (security::contains_shell_metacharacters(raw) || has_line_break(raw)) {
    builder.add(ThreatCategory::CommandInjection, Severity::High, raw,
                "Argument contains shell metacharacters");
  }

  if (builder.empty()) {
    return builder.finish(true, quote_if_needed(std::string(raw)));
  }
  builder.suggest("Pass the value as a separate argument without shell syntax");
  return builder.finish(false, clean_arg(raw, config.max_arg_length));
}

ValidationResult validate_input(const InputKind kind, const std::string_view raw,
                                const ValidationConfig &config) {
  switch (kind) {
  case InputKind::ProjectName:
    return validate_project_name(raw, config);
  case InputKind::PackageManager:
    return validate_package_manager(raw, config);
  case InputKind::Path:
    return validate_path(raw, config);
  case InputKind::CommandArg:
    return validate_command_arg(raw, config);
  }
  return validate_project_name(raw, config);
}

ValidationResult validate_input(const InputKind kind, const memory::Value &value,
                                const ValidationConfig &config) {
  if (value.is_string()) {
    return validate_input(kind, std::string_view(value.as_string()), config);
  }
  ResultBuilder builder;
  builder.malformed("Expected a string but received " +
                    std::string(memory::value_kind_name(value.kind())));
  return builder.finish(false, std::string(fallback_for(kind)));
}

std::vector<std::string> sanitize_command_args(const std::vector<std::string> &args,
                                               const ValidationConfig &config) {
  std::vector<std::string> out;
  out.reserve(args.size());
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];
    if (!config.strict_mode) {
      std::string cleaned = clean_arg(arg, config.max_arg_length);
      if (!cleaned.empty()) {
        out.push_back(std::move(cleaned));
      }
      continue;
    }

    ValidationResult result = validate_command_arg(arg, config);
    if (!result.is_valid) {
      const std::string reason = result.errors.empty() ? "invalid argument" : result.errors.front();
      throw InputValidationError("argument " + std::to_string(i) + ": " + reason,
                                 std::move(result.violations));
    }
    out.push_back(std::move(result.sanitized));
  }
  return out;
}

} // namespace wardline::validation
