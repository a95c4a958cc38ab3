#pragma once

#include "wardline/security/violation.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace wardline::security {

enum class PatternAction { Replace, Flag };

struct MatchSpan {
  std::size_t offset = 0;
  std::size_t length = 0;
};

using SpanScanner = std::vector<MatchSpan> (*)(std::string_view text);

/// One row of the injection table. Exactly one of `regex` and `scanner` is set.
struct PatternEntry {
  const char *label;
  ThreatCategory category;
  Severity severity;
  PatternAction action;
  std::string tag;
  std::optional<std::regex> regex;
  SpanScanner scanner = nullptr;
};

/// Non-overlapping, non-empty matches from left to right.
[[nodiscard]] std::vector<MatchSpan> find_matches(const PatternEntry &entry, std::string_view text);
[[nodiscard]] std::vector<MatchSpan> find_regex_matches(const std::regex &regex,
                                                        std::string_view text);

/// Built-in injection table in application order: flags first, then
/// replacements.
[[nodiscard]] const std::vector<PatternEntry> &injection_patterns();

/// `$(...)` with balanced parentheses; unterminated substitutions are skipped.
[[nodiscard]] std::vector<MatchSpan> find_command_substitutions(std::string_view text);
/// Paired backticks; a trailing unpaired backtick is skipped.
[[nodiscard]] std::vector<MatchSpan> find_backtick_spans(std::string_view text);

[[nodiscard]] const std::vector<std::string_view> &known_binaries();

[[nodiscard]] bool is_bidi_control(std::uint32_t cp);
[[nodiscard]] bool is_zero_width(std::uint32_t cp);
[[nodiscard]] std::optional<char> latin_lookalike(std::uint32_t cp);

/// Cyrillic or Greek lookalikes that sit inside a token which also holds
/// Latin letters. Text must be valid UTF-8.
[[nodiscard]] std::vector<MatchSpan> find_confusables(std::string_view text);

[[nodiscard]] bool contains_path_traversal(std::string_view text);
/// Percent-encoded dots or separators, or Unicode lookalikes of them.
[[nodiscard]] bool contains_encoded_path_sequence(std::string_view text);
[[nodiscard]] bool is_absolute_path(std::string_view text);
[[nodiscard]] bool contains_shell_metacharacters(std::string_view text);
[[nodiscard]] bool references_sensitive_file(std::string_view text);

/// Generic risk analysis for identifiers, paths and command strings. Each
/// matching group contributes one violation.
[[nodiscard]] RiskAnalysis analyze_input_security(std::string_view input);

[[nodiscard]] bool is_path_safe(std::string_view path);
[[nodiscard]] bool is_command_safe(std::string_view command);

} // namespace wardline::security
