#pragma once

#include "wardline/common/result.hpp"
#include "wardline/memory/value.hpp"
#include "wardline/security/violation.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wardline::validation {

enum class InputKind { ProjectName, PackageManager, Path, CommandArg };

[[nodiscard]] std::string_view input_kind_name(InputKind kind);
[[nodiscard]] std::optional<InputKind> parse_input_kind(const std::string &value);

inline constexpr std::size_t kMinProjectNameLength = 2;
inline constexpr std::size_t kMaxProjectNameLength = 214;
inline constexpr std::string_view kDefaultProjectName = "untitled-project";
inline constexpr std::string_view kDefaultPackageManager = "npm";
inline constexpr std::string_view kDefaultPath = ".";

struct ValidationConfig {
  bool strict_mode = false;
  bool auto_sanitize = false;
  bool allow_path_traversal = false;
  bool allow_absolute_paths = false;
  /// Root that relative paths must stay under. Empty means the current
  /// directory.
  std::string working_directory;
  std::size_t max_arg_length = 10240;
  std::size_t max_path_length = 4096;
  std::vector<std::string> allowed_package_managers = {"npm", "pnpm", "yarn", "bun"};
};

struct ValidationResult {
  bool is_valid = false;
  /// Always populated; a safe default when the input cannot be repaired.
  std::string sanitized;
  std::vector<security::SecurityViolation> violations;
  std::uint32_t risk_score = 0;
  std::vector<std::string> suggestions;
  std::vector<std::string> errors;
};

class InputValidationError : public std::runtime_error {
public:
  InputValidationError(const std::string &message,
                       std::vector<security::SecurityViolation> violations = {});

  [[nodiscard]] const std::vector<security::SecurityViolation> &violations() const noexcept {
    return violations_;
  }

private:
  std::vector<security::SecurityViolation> violations_;
};

[[nodiscard]] ValidationResult validate_project_name(std::string_view raw,
                                                     const ValidationConfig &config = {});
[[nodiscard]] ValidationResult validate_package_manager(std::string_view raw,
                                                        const ValidationConfig &config = {});
[[nodiscard]] ValidationResult validate_path(std::string_view raw,
                                             const ValidationConfig &config = {});
[[nodiscard]] ValidationResult validate_command_arg(std::string_view raw,
                                                    const ValidationConfig &config = {});

[[nodiscard]] ValidationResult validate_input(InputKind kind, std::string_view raw,
                                              const ValidationConfig &config = {});
/// Non-string values are rejected with risk 100.
[[nodiscard]] ValidationResult validate_input(InputKind kind, const memory::Value &value,
                                              const ValidationConfig &config = {});

/// Lower-cases, maps disallowed characters to '-', collapses separator runs
/// and trims separators from both ends.
[[nodiscard]] std::string sanitize_project_name(std::string_view raw);

[[nodiscard]] common::Result<std::string> sanitize_path(std::string_view raw,
                                                        const ValidationConfig &config = {});

/// Strict mode throws InputValidationError on shell metacharacters or
/// over-long arguments. Otherwise metacharacters are stripped, arguments are
/// truncated to max_arg_length and quoted when they contain whitespace; empty
/// results are dropped.
[[nodiscard]] std::vector<std::string> sanitize_command_args(const std::vector<std::string> &args,
                                                             const ValidationConfig &config = {});

} // namespace wardline::validation
