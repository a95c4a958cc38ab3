#pragma once

#include "wardline/common/levels.hpp"
#include "wardline/common/result.hpp"
#include "wardline/security/violation.hpp"

#include <cstddef>
#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace wardline::security {

using common::ProtectionLevel;

struct CustomPattern {
  std::regex regex;
  std::string tag = "[CUSTOM-PATTERN]";
  Severity severity = Severity::Medium;
  /// Expression text, kept for diagnostics and config round trips.
  std::string source;
};

using ViolationCallback = std::function<void(const SecurityViolation &)>;

struct SanitizationConfig {
  ProtectionLevel protection_level = ProtectionLevel::Standard;
  bool preserve_formatting = false;
  bool allow_control_chars = false;
  bool detect_terminal_manipulation = true;
  std::vector<CustomPattern> custom_patterns;
  std::size_t max_input_length = 2000;
  std::size_t whitespace_flood_threshold = 20;
  ViolationCallback on_violation;
};

[[nodiscard]] SanitizationConfig sanitization_preset(ProtectionLevel level);

/// Configuration used by the logging facade: the standard preset with a
/// larger input budget.
[[nodiscard]] const SanitizationConfig &log_sanitization_config();

/// Compiles an ECMAScript expression. An empty tag falls back to
/// "[CUSTOM-PATTERN]".
[[nodiscard]] common::Result<CustomPattern>
compile_custom_pattern(const std::string &expression, const std::string &tag = "",
                       Severity severity = Severity::Medium);

} // namespace wardline::security
