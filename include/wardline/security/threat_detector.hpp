#pragma once

#include "wardline/memory/value.hpp"
#include "wardline/security/sanitize_config.hpp"
#include "wardline/security/violation.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace wardline::security {

inline constexpr std::string_view kTruncatedMarker = "[TRUNCATED]";

struct SanitizationResult {
  std::string sanitized;
  RiskAnalysis analysis;
  bool truncated = false;
};

struct LogSecurityReport {
  std::string sanitized;
  RiskAnalysis analysis;
  bool has_ansi_escapes = false;
  bool has_control_chars = false;
  bool has_line_injection = false;
  bool has_format_strings = false;
  bool has_terminal_manipulation = false;
  bool has_command_execution = false;
  bool has_unicode_attacks = false;
  std::vector<std::string> warnings;
};

/// Runs the full pipeline: length gate, control sequences, unicode, injection
/// table, network references, line endings. Never throws for any input, and
/// sanitizing the output again yields the same text.
[[nodiscard]] SanitizationResult scan(std::string_view text, const SanitizationConfig &config = {});
/// Non-string values are treated as the empty string.
[[nodiscard]] SanitizationResult scan(const memory::Value &value,
                                      const SanitizationConfig &config = {});

[[nodiscard]] std::string sanitize(std::string_view text, const SanitizationConfig &config = {});
[[nodiscard]] std::string sanitize(const memory::Value &value,
                                   const SanitizationConfig &config = {});

[[nodiscard]] RiskAnalysis analyze(std::string_view text, const SanitizationConfig &config = {});
[[nodiscard]] RiskAnalysis analyze(const memory::Value &value,
                                   const SanitizationConfig &config = {});

[[nodiscard]] LogSecurityReport analyze_log_security(std::string_view text,
                                                     const SanitizationConfig &config = {});

} // namespace wardline::security
