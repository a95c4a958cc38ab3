#include "wardline/security/violation.hpp"

#include "wardline/common/utf8.hpp"

#include <algorithm>
#include <utility>

namespace wardline::security {

std::string_view category_name(const ThreatCategory category) {
  switch (category) {
  case ThreatCategory::AnsiCsi:
    return "ansi_csi";
  case ThreatCategory::OscCommand:
    return "osc_command";
  case ThreatCategory::DcsCommand:
    return "dcs_command";
  case ThreatCategory::TerminalReset:
    return "terminal_reset";
  case ThreatCategory::ControlChar:
    return "control_char";
  case ThreatCategory::BidiOverride:
    return "bidi_override";
  case ThreatCategory::ZeroWidth:
    return "zero_width";
  case ThreatCategory::Confusable:
    return "confusable";
  case ThreatCategory::ShellCommand:
    return "shell_command";
  case ThreatCategory::EvalAttempt:
    return "eval_attempt";
  case ThreatCategory::FormatString:
    return "format_string";
  case ThreatCategory::Hyperlink:
    return "hyperlink";
  case ThreatCategory::Url:
    return "url";
  case ThreatCategory::FileUrl:
    return "file_url";
  case ThreatCategory::CrLf:
    return "crlf";
  case ThreatCategory::NullByte:
    return "null_byte";
  case ThreatCategory::WhitespaceFlood:
    return "whitespace_flood";
  case ThreatCategory::PathTraversal:
    return "path_traversal";
  case ThreatCategory::CommandInjection:
    return "command_injection";
  case ThreatCategory::PrivilegeEscalation:
    return "privilege_escalation";
  case ThreatCategory::ScriptInjection:
    return "script_injection";
  case ThreatCategory::MalformedInput:
    return "malformed_input";
  case ThreatCategory::SuspiciousPattern:
    return "suspicious_pattern";
  }
  return "suspicious_pattern";
}

std::string_view default_tag(const ThreatCategory category) {
  switch (category) {
  case ThreatCategory::AnsiCsi:
    return "[ANSI-CSI]";
  case ThreatCategory::OscCommand:
  case ThreatCategory::Hyperlink:
    return "[OSC-CMD]";
  case ThreatCategory::DcsCommand:
    return "[DCS-CMD]";
  case ThreatCategory::TerminalReset:
    return "[TERM-RESET]";
  case ThreatCategory::BidiOverride:
    return "[BIDI]";
  case ThreatCategory::Confusable:
    return "[CONFUSABLE]";
  case ThreatCategory::ShellCommand:
    return "[SHELL-CMD]";
  case ThreatCategory::EvalAttempt:
    return "[EVAL-ATTEMPT]";
  case ThreatCategory::FormatString:
    return "[FORMAT]";
  case ThreatCategory::Url:
    return "[URL]";
  case ThreatCategory::FileUrl:
    return "[FILE-URL]";
  case ThreatCategory::NullByte:
    return "[NULL]";
  case ThreatCategory::WhitespaceFlood:
    return "[WHITESPACE]";
  case ThreatCategory::SuspiciousPattern:
    return "[CUSTOM-PATTERN]";
  case ThreatCategory::ControlChar:
  case ThreatCategory::ZeroWidth:
  case ThreatCategory::CrLf:
  case ThreatCategory::PathTraversal:
  case ThreatCategory::CommandInjection:
  case ThreatCategory::PrivilegeEscalation:
  case ThreatCategory::ScriptInjection:
  case ThreatCategory::MalformedInput:
    return "";
  }
  return "";
}

AttackVector attack_vector_for(const ThreatCategory category) {
  switch (category) {
  case ThreatCategory::AnsiCsi:
  case ThreatCategory::OscCommand:
  case ThreatCategory::DcsCommand:
    return AttackVector::TerminalEscape;
  case ThreatCategory::TerminalReset:
    return AttackVector::TerminalManipulation;
  case ThreatCategory::Hyperlink:
    return AttackVector::LinkSpoofing;
  case ThreatCategory::ControlChar:
  case ThreatCategory::NullByte:
    return AttackVector::ControlInjection;
  case ThreatCategory::BidiOverride:
  case ThreatCategory::ZeroWidth:
  case ThreatCategory::Confusable:
    return AttackVector::UnicodeSpoofing;
  case ThreatCategory::ShellCommand:
  case ThreatCategory::EvalAttempt:
  case ThreatCategory::CommandInjection:
  case ThreatCategory::PrivilegeEscalation:
  case ThreatCategory::ScriptInjection:
  case ThreatCategory::SuspiciousPattern:
    return AttackVector::CodeExecution;
  case ThreatCategory::FormatString:
    return AttackVector::FormatString;
  case ThreatCategory::Url:
  case ThreatCategory::FileUrl:
    return AttackVector::NetworkReference;
  case ThreatCategory::CrLf:
  case ThreatCategory::WhitespaceFlood:
    return AttackVector::LogForging;
  case ThreatCategory::PathTraversal:
    return AttackVector::PathTraversal;
  case ThreatCategory::MalformedInput:
    return AttackVector::MalformedInput;
  }
  return AttackVector::MalformedInput;
}

std::string_view attack_vector_name(const AttackVector vector) {
  switch (vector) {
  case AttackVector::TerminalEscape:
    return "terminal-escape";
  case AttackVector::TerminalManipulation:
    return "terminal-manipulation";
  case AttackVector::LinkSpoofing:
    return "link-spoofing";
  case AttackVector::ControlInjection:
    return "control-injection";
  case AttackVector::UnicodeSpoofing:
    return "unicode-spoofing";
  case AttackVector::CodeExecution:
    return "code-execution";
  case AttackVector::FormatString:
    return "format-string";
  case AttackVector::NetworkReference:
    return "network-reference";
  case AttackVector::LogForging:
    return "log-forging";
  case AttackVector::PathTraversal:
    return "path-traversal";
  case AttackVector::MalformedInput:
    return "malformed-input";
  }
  return "malformed-input";
}

std::string_view risk_level_name(const RiskLevel level) {
  switch (level) {
  case RiskLevel::Low:
    return "low";
  case RiskLevel::Medium:
    return "medium";
  case RiskLevel::High:
    return "high";
  case RiskLevel::Critical:
    return "critical";
  }
  return "low";
}

std::string_view recommendation_for(const ThreatCategory category) {
  switch (category) {
  case ThreatCategory::AnsiCsi:
  case ThreatCategory::OscCommand:
  case ThreatCategory::DcsCommand:
    return "Strip terminal escape sequences before writing untrusted text to a terminal";
  case ThreatCategory::TerminalReset:
    return "Never forward terminal reset sequences from untrusted input";
  case ThreatCategory::Hyperlink:
    return "Render link targets as plain text so they cannot be disguised";
  case ThreatCategory::ControlChar:
    return "Remove control characters from untrusted text";
  case ThreatCategory::BidiOverride:
    return "Reject bidirectional overrides; they can reorder displayed text";
  case ThreatCategory::ZeroWidth:
    return "Remove zero-width characters that hide content";
  case ThreatCategory::Confusable:
    return "Normalize identifiers to a single script before comparing them";
  case ThreatCategory::ShellCommand:
  case ThreatCategory::CommandInjection:
    return "Pass arguments as a vector and never through a shell";
  case ThreatCategory::EvalAttempt:
  case ThreatCategory::ScriptInjection:
    return "Never evaluate untrusted text as code";
  case ThreatCategory::FormatString:
    return "Use untrusted text as an argument, never as a format string";
  case ThreatCategory::Url:
  case ThreatCategory::FileUrl:
    return "Verify link targets before following them";
  case ThreatCategory::CrLf:
    return "Escape line breaks so one input cannot forge several log entries";
  case ThreatCategory::NullByte:
    return "Reject embedded NUL bytes; they truncate strings in native APIs";
  case ThreatCategory::WhitespaceFlood:
    return "Collapse long whitespace runs that can push content off screen";
  case ThreatCategory::PathTraversal:
    return "Resolve paths against a fixed root and reject escapes";
  case ThreatCategory::PrivilegeEscalation:
    return "Do not run privileged commands on behalf of untrusted input";
  case ThreatCategory::MalformedInput:
    return "Reject input that is not valid UTF-8";
  case ThreatCategory::SuspiciousPattern:
    return "Review the matched content";
  }
  return "Review the matched content";
}

std::uint32_t severity_points(const Severity severity) {
  switch (severity) {
  case Severity::Critical:
    return 30;
  case Severity::High:
    return 15;
  case Severity::Medium:
    return 8;
  case Severity::Low:
    return 3;
  }
  return 0;
}

RiskLevel risk_level_for(const std::uint32_t score) {
  if (score >= 70) {
    return RiskLevel::Critical;
  }
  if (score >= 40) {
    return RiskLevel::High;
  }
  if (score >= 1) {
    return RiskLevel::Medium;
  }
  return RiskLevel::Low;
}

SecurityViolation make_violation(const ThreatCategory category, const Severity severity,
                                 const std::string_view span, const std::size_t offset,
                                 std::string replacement_tag) {
  SecurityViolation violation;
  violation.category = category;
  violation.severity = severity;
  violation.original_span = std::string(span.substr(0, common::utf8_prefix_length(span, kMaxSpanBytes)));
  violation.replacement_tag = std::move(replacement_tag);
  violation.recommendation = std::string(recommendation_for(category));
  violation.offset = offset;
  return violation;
}

void RiskAnalysis::record(SecurityViolation violation) {
  risk_score = std::min(kMaxRiskScore, risk_score + severity_points(violation.severity));
  risk_level = risk_level_for(risk_score);

  if (!has_category(violation.category)) {
    threat_categories.push_back(violation.category);
  }
  const AttackVector vector = attack_vector_for(violation.category);
  if (!has_vector(vector)) {
    attack_vectors.push_back(vector);
  }

  if (violations.size() >= kMaxRecordedViolations) {
    ++suppressed_violations;
    return;
  }
  violations.push_back(std::move(violation));
}

bool RiskAnalysis::has_category(const ThreatCategory category) const {
  return std::find(threat_categories.begin(), threat_categories.end(), category) !=
         threat_categories.end();
}

bool RiskAnalysis::has_vector(const AttackVector vector) const {
  return std::find(attack_vectors.begin(), attack_vectors.end(), vector) != attack_vectors.end();
}

} // namespace wardline::security
