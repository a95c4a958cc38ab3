#pragma once

#include "wardline/common/levels.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wardline::security {

using common::Severity;

enum class ThreatCategory {
  AnsiCsi,
  OscCommand,
  DcsCommand,
  TerminalReset,
  ControlChar,
  BidiOverride,
  ZeroWidth,
  Confusable,
  ShellCommand,
  EvalAttempt,
  FormatString,
  Hyperlink,
  Url,
  FileUrl,
  CrLf,
  NullByte,
  WhitespaceFlood,
  PathTraversal,
  CommandInjection,
  PrivilegeEscalation,
  ScriptInjection,
  MalformedInput,
  SuspiciousPattern,
};

enum class RiskLevel { Low, Medium, High, Critical };

enum class AttackVector {
  TerminalEscape,
  TerminalManipulation,
  LinkSpoofing,
  ControlInjection,
  UnicodeSpoofing,
  CodeExecution,
  FormatString,
  NetworkReference,
  LogForging,
  PathTraversal,
  MalformedInput,
};

inline constexpr std::size_t kMaxSpanBytes = 64;
inline constexpr std::size_t kMaxRecordedViolations = 256;
inline constexpr std::uint32_t kMaxRiskScore = 100;

struct SecurityViolation {
  ThreatCategory category = ThreatCategory::SuspiciousPattern;
  Severity severity = Severity::Low;
  std::string original_span;
  std::string replacement_tag;
  std::string recommendation;
  std::size_t offset = 0;
};

[[nodiscard]] std::string_view category_name(ThreatCategory category);
[[nodiscard]] std::string_view default_tag(ThreatCategory category);
[[nodiscard]] AttackVector attack_vector_for(ThreatCategory category);
[[nodiscard]] std::string_view attack_vector_name(AttackVector vector);
[[nodiscard]] std::string_view risk_level_name(RiskLevel level);
[[nodiscard]] std::string_view recommendation_for(ThreatCategory category);

[[nodiscard]] std::uint32_t severity_points(Severity severity);
[[nodiscard]] RiskLevel risk_level_for(std::uint32_t score);

/// The span is cut to kMaxSpanBytes at a UTF-8 boundary.
[[nodiscard]] SecurityViolation make_violation(ThreatCategory category, Severity severity,
                                               std::string_view span, std::size_t offset,
                                               std::string replacement_tag = "");

struct RiskAnalysis {
  std::uint32_t risk_score = 0;
  RiskLevel risk_level = RiskLevel::Low;
  std::vector<SecurityViolation> violations;
  std::vector<ThreatCategory> threat_categories;
  std::vector<AttackVector> attack_vectors;
  std::size_t suppressed_violations = 0;

  /// Adds the violation's points and projections. Past the recording cap the
  /// violation only counts towards the score.
  void record(SecurityViolation violation);

  [[nodiscard]] bool has_category(ThreatCategory category) const;
  [[nodiscard]] bool has_vector(AttackVector vector) const;
  [[nodiscard]] std::size_t total_violations() const {
    return violations.size() + suppressed_violations;
  }
};

} // namespace wardline::security
