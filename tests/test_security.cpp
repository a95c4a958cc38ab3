#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "wardline/memory/value.hpp"
#include "wardline/security/patterns.hpp"
#include "wardline/security/sanitize_config.hpp"
#include "wardline/security/threat_detector.hpp"

#include <initializer_list>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace sec = wardline::security;

std::size_t count_category(const sec::RiskAnalysis &analysis, const sec::ThreatCategory category) {
  std::size_t count = 0;
  for (const auto &violation : analysis.violations) {
    if (violation.category == category) {
      ++count;
    }
  }
  return count;
}

} // namespace

void register_security_tests(std::vector<wardline::tests::TestCase> &tests) {
  using wardline::tests::require;
  namespace testing = wardline::testing;
  namespace mem = wardline::memory;

  tests.push_back({"security_sgr_sequences_become_tags", [] {
                     const auto result = sec::scan("Normal \x1B[31mred\x1B[0m text");
                     require(result.sanitized == "Normal [ANSI-CSI]red[ANSI-CSI] text",
                             "unexpected output: " + result.sanitized);
                     require(result.analysis.violations.size() == 2, "two CSI violations");
                     require(result.analysis.violations[0].severity == sec::Severity::Medium,
                             "SGR is medium");
                     require(result.analysis.risk_score == 16, "two medium violations score 16");
                     require(result.analysis.risk_level == sec::RiskLevel::Medium, "medium level");
                     require(result.analysis.has_vector(sec::AttackVector::TerminalEscape),
                             "terminal escape vector expected");
                   }});

  tests.push_back({"security_destructive_substitution_is_critical", [] {
                     const auto result = sec::scan("$(rm -rf /)");
                     require(result.sanitized == "[SHELL-CMD]", "got " + result.sanitized);
                     require(result.analysis.risk_score == 75,
                             "expected 75, got " + std::to_string(result.analysis.risk_score));
                     require(result.analysis.risk_level == sec::RiskLevel::Critical,
                             "critical level expected");
                     require(result.analysis.has_category(sec::ThreatCategory::CommandInjection),
                             "destructive flag expected");
                     require(result.analysis.has_category(sec::ThreatCategory::ShellCommand),
                             "substitution replacement expected");
                     require(sec::analyze_log_security("$(rm -rf /)").has_command_execution,
                             "log report should flag command execution");
                   }});

  tests.push_back({"security_plain_substitution_single_violation", [] {
                     const auto analysis = sec::analyze("$(evil)");
                     require(analysis.violations.size() == 1, "one violation expected");
                     require(analysis.violations[0].category == sec::ThreatCategory::ShellCommand,
                             "shell command expected");
                     require(analysis.violations[0].severity == sec::Severity::Critical,
                             "substitution is critical");
                     require(analysis.violations[0].original_span == "$(evil)", "span mismatch");
                     require(analysis.violations[0].replacement_tag == "[SHELL-CMD]",
                             "tag mismatch");
                   }});

  tests.push_back({"security_nested_substitution_replaced_once", [] {
                     require(sec::sanitize("a $(echo $(id)) b") == "a [SHELL-CMD] b",
                             "outermost substitution should be replaced");
                     require(sec::sanitize("price $(unclosed") == "price $(unclosed",
                             "unterminated substitution is left alone");
                     require(sec::sanitize("run `id` now") == "run [SHELL-CMD] now",
                             "backticks should be replaced");
                   }});

  tests.push_back({"security_length_gate_truncates", [] {
                     const auto result = sec::scan(std::string(10000, 'A'));
                     require(result.truncated, "input should be truncated");
                     require(result.sanitized.size() == 2011,
                             "unexpected length " + std::to_string(result.sanitized.size()));
                     require(result.sanitized == std::string(2000, 'A') + "[TRUNCATED]",
                             "truncated output mismatch");
                     require(result.analysis.violations.empty(), "truncation is not a violation");
                     require(!sec::scan(std::string(2000, 'A')).truncated,
                             "exact limit is not truncated");
                   }});

  tests.push_back({"security_markers_do_not_count_but_hard_cap_applies", [] {
                     sec::SanitizationConfig config;
                     config.max_input_length = 10;
                     std::string input;
                     for (int i = 0; i < 100; ++i) {
                       input += "[URL]";
                     }
                     const auto result = sec::scan(input, config);
                     require(result.truncated, "hard cap should cut");
                     require(result.sanitized.size() == 80 + 11,
                             "cut at eight times the limit, got " +
                                 std::to_string(result.sanitized.size()));
                     require(sec::sanitize(result.sanitized, config) == result.sanitized,
                             "capped output should be stable");
                   }});

  tests.push_back({"security_sanitize_is_idempotent", [] {
                     const std::vector<std::string> inputs = {
                         "Normal \x1B[31mred\x1B[0m text",
                         "$(rm -rf /)",
                         "line1\nline2 `id` https://x.io %s",
                         std::string(5000, 'B'),
                         "p\xD0\xB0ypal login \xE2\x80\xAE" "cod.exe",
                         "ls; cat /etc/passwd && eval(x)",
                         "tabs\there\r\nand      lots                      of space",
                     };
                     for (const auto &input : inputs) {
                       const std::string once = sec::sanitize(input);
                       const std::string twice = sec::sanitize(once);
                       require(once == twice, "not idempotent: '" + once + "' vs '" + twice + "'");
                     }
                   }});

  tests.push_back({"security_tags_never_split_words_or_parentheses", [] {
                     const auto joined = sec::scan(";rmfile://");
                     require(joined.sanitized == ";rmfile://", "got " + joined.sanitized);
                     require(!joined.analysis.has_category(sec::ThreatCategory::FileUrl),
                             "scheme inside a word is not a link");
                     require(sec::sanitize(joined.sanitized) == joined.sanitized,
                             "second run leaves the word alone");
                     require(sec::sanitize("; rm file://x") == "[SHELL-CMD] [FILE-URL]file://x",
                             "separated words are still tagged");

                     const std::string open_eval = sec::sanitize("$(eval()");
                     require(open_eval == "$([EVAL-ATTEMPT]()", "got " + open_eval);
                     require(sec::sanitize(open_eval) == open_eval,
                             "eval tag keeps the substitution unterminated");
                   }});

  tests.push_back({"security_sanitize_is_idempotent_over_random_fragments", [] {
                     const std::vector<std::string> fragments = {
                         "\x1B[31m", "\x1B]0;t\x07", "\x1B", "\x01", "\n", "\r\n", "\r", "\t",
                         " ", std::string(24, ' '), ";", "; rm", "&& cat", "rm", "eval", "eval(",
                         "(", ")", "$(", "$(rm -rf /)", "`id`", "%s", "%08x", "sudo ", "http://",
                         "https://a.io/p", "file://", "file", "x", "a", "-", "/",
                         "\xE2\x80\x8B", "\xE2\x80\xAE", "p\xD0\xB0y", "\xD0\xB0",
                         "caf\xC3\xA9",
                     };
                     std::mt19937 rng(20261019U);
                     std::uniform_int_distribution<std::size_t> pick(0, fragments.size() - 1);
                     std::uniform_int_distribution<int> length(1, 8);
                     for (const auto level : {sec::ProtectionLevel::Standard,
                                              sec::ProtectionLevel::Strict}) {
                       const auto config = sec::sanitization_preset(level);
                       for (int round = 0; round < 1000; ++round) {
                         std::string input;
                         for (int n = length(rng); n > 0; --n) {
                           input += fragments[pick(rng)];
                         }
                         const auto once = sec::scan(input, config);
                         const std::string twice = sec::sanitize(once.sanitized, config);
                         require(once.sanitized == twice,
                                 "not idempotent: '" + once.sanitized + "' vs '" + twice + "'");
                         std::size_t previous = 0;
                         for (const auto &violation : once.analysis.violations) {
                           require(violation.offset >= previous, "offsets out of order");
                           require(violation.offset < input.size(), "offset outside the input");
                           previous = violation.offset;
                         }
                       }
                     }
                   }});

  tests.push_back({"security_violations_ordered_by_input_offset", [] {
                     const auto mixed = sec::analyze("%s then \x1B[31mX");
                     require(mixed.violations.size() == 2, "two violations");
                     require(mixed.violations[0].category == sec::ThreatCategory::FormatString &&
                                 mixed.violations[0].offset == 0,
                             "format specifier first at 0");
                     require(mixed.violations[1].category == sec::ThreatCategory::AnsiCsi &&
                                 mixed.violations[1].offset == 8,
                             "escape second at 8");

                     const auto hidden = sec::analyze("\xE2\x80\x8B\xE2\x80\x8B ab; rm x %d");
                     require(hidden.violations.size() == 3, "three violations");
                     require(hidden.violations[0].category == sec::ThreatCategory::ZeroWidth &&
                                 hidden.violations[0].offset == 0,
                             "zero-width run at 0");
                     require(hidden.violations[1].category == sec::ThreatCategory::ShellCommand &&
                                 hidden.violations[1].offset == 9,
                             "chaining offset counts the removed bytes, got " +
                                 std::to_string(hidden.violations[1].offset));
                     require(hidden.violations[2].offset == 16, "format offset in the input");

                     const auto lines = sec::analyze("a\nb; cat\x1B[2J" "c");
                     require(lines.violations.size() == 3, "three violations");
                     require(lines.violations[0].category == sec::ThreatCategory::CrLf &&
                                 lines.violations[0].offset == 1,
                             "line break first");
                     require(lines.violations[1].category == sec::ThreatCategory::ShellCommand &&
                                 lines.violations[1].offset == 3,
                             "chaining second");
                     require(lines.violations[2].category == sec::ThreatCategory::AnsiCsi &&
                                 lines.violations[2].offset == 8,
                             "escape last");

                     const auto link = sec::analyze("\x1B[1mhttp://x");
                     require(link.violations.size() == 2 && link.violations[1].offset == 4,
                             "link offset skips the inserted tag");

                     const auto repaired = sec::analyze("ab\xFF%s");
                     require(repaired.violations[0].category ==
                                     sec::ThreatCategory::MalformedInput &&
                                 repaired.violations[0].offset == 2,
                             "invalid byte located");
                     require(repaired.violations[1].offset == 3,
                             "offsets after a repair point into the input");

                     std::vector<std::size_t> seen;
                     sec::SanitizationConfig config;
                     config.on_violation = [&seen](const sec::SecurityViolation &violation) {
                       seen.push_back(violation.offset);
                     };
                     (void)sec::scan("%s then \x1B[31mX", config);
                     require(seen == std::vector<std::size_t>{0, 8},
                             "callback sees violations in input order");
                   }});

  tests.push_back({"security_osc_and_dcs_sequences", [] {
                     const auto link =
                         sec::scan("\x1B]8;;http://evil.example\x07" "click\x1B]8;;\x07");
                     require(link.sanitized == "[OSC-CMD]click[OSC-CMD]", "got " + link.sanitized);
                     require(count_category(link.analysis, sec::ThreatCategory::Hyperlink) == 2,
                             "two hyperlink violations");
                     require(sec::analyze_log_security("\x1B]8;;x\x07y\x1B]8;;\x07")
                                 .has_terminal_manipulation,
                             "hyperlinks count as terminal manipulation");

                     const auto title = sec::scan("\x1B]0;title\x1B\\rest");
                     require(title.sanitized == "[OSC-CMD]rest", "got " + title.sanitized);
                     require(title.analysis.violations[0].severity == sec::Severity::High,
                             "OSC is high");

                     require(sec::sanitize("\x1B]0;unterminated") == "[OSC-CMD]0;unterminated",
                             "unterminated OSC tags only the introducer");
                     require(sec::sanitize("a\x1BPpayload\x1B\\b") == "a[DCS-CMD]b",
                             "DCS should be replaced whole");
                   }});

  tests.push_back({"security_reset_csi_and_other_escapes", [] {
                     const auto reset = sec::scan("x\x1B" "cy");
                     require(reset.sanitized == "x[TERM-RESET]y", "got " + reset.sanitized);
                     require(reset.analysis.violations[0].category ==
                                 sec::ThreatCategory::TerminalReset,
                             "reset category");

                     const auto clear = sec::scan("\x1B[2J");
                     require(clear.sanitized == "[ANSI-CSI]", "got " + clear.sanitized);
                     require(clear.analysis.violations[0].severity == sec::Severity::High,
                             "non-SGR CSI is high");

                     require(sec::sanitize("a\x1B(Bb") == "a[ANSI-CSI]b",
                             "charset escape should be tagged");
                     require(sec::sanitize("end\x1B") == "end", "lone ESC is dropped");
                   }});

  tests.push_back({"security_control_characters_removed", [] {
                     const auto result = sec::scan("a\x01\x02" "b\xC2\x85" "c");
                     require(result.sanitized == "abc", "got " + result.sanitized);
                     require(result.analysis.violations.size() == 2,
                             "adjacent C0 run merges, C1 is separate");
                     require(result.analysis.violations[0].original_span == "\x01\x02",
                             "merged span mismatch");

                     sec::SanitizationConfig allow;
                     allow.allow_control_chars = true;
                     require(sec::sanitize("a\x01" "b", allow) == "a\x01" "b",
                             "allowed control chars pass through");

                     sec::SanitizationConfig no_terminal;
                     no_terminal.detect_terminal_manipulation = false;
                     const auto raw = sec::scan("\x1B[31mx", no_terminal);
                     require(raw.sanitized == "[31mx", "ESC is dropped without escape parsing");
                     require(raw.analysis.violations[0].category ==
                                 sec::ThreatCategory::ControlChar,
                             "ESC reported as control char");
                   }});

  tests.push_back({"security_null_bytes", [] {
                     const std::string input("a\0b", 3);
                     const auto dropped = sec::scan(input);
                     require(dropped.sanitized == "ab", "NUL should be dropped");
                     require(dropped.analysis.violations[0].category ==
                                     sec::ThreatCategory::NullByte &&
                                 dropped.analysis.violations[0].severity == sec::Severity::High,
                             "NUL is a high null-byte violation");

                     sec::SanitizationConfig allow;
                     allow.allow_control_chars = true;
                     require(sec::sanitize(input, allow) == "a[NULL]b",
                             "allowed NUL is tagged in the line pass");
                     require(sec::analyze_log_security(input).has_control_chars,
                             "log report flags NUL");
                   }});

  tests.push_back({"security_tabs_and_line_endings", [] {
                     require(sec::sanitize("a\tb") == "a b", "tab becomes a space");
                     const auto lines = sec::scan("a\r\nb\rc\nd");
                     require(lines.sanitized == "a[CRLF]b[CR]c[LF]d", "got " + lines.sanitized);
                     require(count_category(lines.analysis, sec::ThreatCategory::CrLf) == 3,
                             "three line-ending violations");

                     sec::SanitizationConfig keep;
                     keep.preserve_formatting = true;
                     require(sec::sanitize("a\tb\r\nc", keep) == "a\tb\r\nc",
                             "formatting should be preserved");
                   }});

  tests.push_back({"security_whitespace_flood", [] {
                     const auto flood = sec::scan("a" + std::string(20, ' ') + "b");
                     require(flood.sanitized == "a[WHITESPACE]b", "got " + flood.sanitized);
                     require(flood.analysis.violations[0].severity == sec::Severity::Low,
                             "flood is low");
                     const std::string short_run = "a" + std::string(19, ' ') + "b";
                     require(sec::sanitize(short_run) == short_run, "below threshold is kept");

                     sec::SanitizationConfig disabled;
                     disabled.whitespace_flood_threshold = 0;
                     const std::string long_run = "a" + std::string(50, ' ') + "b";
                     require(sec::sanitize(long_run, disabled) == long_run,
                             "threshold 0 disables the check");
                   }});

  tests.push_back({"security_unicode_bidi_zero_width_confusable", [] {
                     const auto bidi = sec::scan("abc\xE2\x80\xAE" "def");
                     require(bidi.sanitized == "abc[BIDI]def", "got " + bidi.sanitized);
                     require(bidi.analysis.violations[0].severity == sec::Severity::Critical,
                             "bidi is critical");

                     const auto hidden = sec::scan("pa\xE2\x80\x8B\xE2\x80\x8Bss");
                     require(hidden.sanitized == "pass", "zero-width removed");
                     require(hidden.analysis.violations.size() == 1, "run reported once");
                     require(hidden.analysis.risk_score == 3, "zero-width is low");

                     const auto spoof = sec::scan("p\xD0\xB0ypal");
                     require(spoof.sanitized == "p[CONFUSABLE]ypal", "got " + spoof.sanitized);
                     require(spoof.analysis.violations[0].severity == sec::Severity::High,
                             "confusable is high");

                     const std::string cyrillic = "\xD0\xBF\xD1\x80\xD0\xB8";
                     require(sec::sanitize(cyrillic) == cyrillic,
                             "all-Cyrillic words are not confusables");
                     require(sec::sanitize("p\xD0\xB0ypal",
                                           sec::sanitization_preset(
                                               sec::ProtectionLevel::Permissive)) ==
                                 "p\xD0\xB0ypal",
                             "permissive skips confusables");
                     require(sec::latin_lookalike(0x0430) == 'a', "lookalike table");
                     require(!sec::latin_lookalike(0x0431).has_value(), "not a lookalike");
                   }});

  tests.push_back({"security_injection_table", [] {
                     const auto chain = sec::scan("ls; cat /etc/passwd");
                     require(chain.sanitized == "ls[SHELL-CMD] /etc/passwd",
                             "got " + chain.sanitized);
                     require(chain.analysis.violations[0].severity == sec::Severity::High,
                             "chaining is high");

                     const auto eval = sec::scan("eval(x)");
                     require(eval.sanitized == "[EVAL-ATTEMPT](x)", "got " + eval.sanitized);
                     require(eval.analysis.violations[0].severity == sec::Severity::Critical,
                             "eval is critical");

                     const auto format = sec::scan("%s %08x %n");
                     require(format.sanitized == "[FORMAT] [FORMAT] [FORMAT]",
                             "got " + format.sanitized);
                     require(format.analysis.risk_score == 24, "three medium violations");

                     const auto sudo = sec::analyze("please sudo reboot");
                     require(sudo.has_category(sec::ThreatCategory::PrivilegeEscalation),
                             "privilege flag expected");
                     require(sec::sanitize("please sudo reboot") == "please sudo reboot",
                             "flags leave the text unchanged");

                     const auto bomb = sec::analyze(":(){ :|:& };:");
                     require(bomb.has_category(sec::ThreatCategory::CommandInjection),
                             "fork bomb flagged");
                   }});

  tests.push_back({"security_network_references", [] {
                     const auto web = sec::scan("see http://a.example now");
                     require(web.sanitized == "see [URL]http://a.example now",
                             "got " + web.sanitized);
                     require(web.analysis.violations[0].severity == sec::Severity::Low,
                             "url is low");
                     require(web.analysis.violations[0].original_span == "http://a.example",
                             "span is the link");

                     const auto file = sec::scan("open file:///etc/passwd");
                     require(file.sanitized == "open [FILE-URL]file:///etc/passwd",
                             "got " + file.sanitized);
                     require(file.analysis.violations[0].severity == sec::Severity::Medium,
                             "file url is medium");

                     require(sec::sanitize("see http://a.example",
                                           sec::sanitization_preset(
                                               sec::ProtectionLevel::Permissive)) ==
                                 "see http://a.example",
                             "permissive leaves links alone");
                   }});

  tests.push_back({"security_custom_patterns", [] {
                     const auto compiled =
                         sec::compile_custom_pattern("secret-\\d+", "[REDACTED]", sec::Severity::High);
                     require(compiled.ok(), compiled.error());
                     sec::SanitizationConfig config;
                     config.custom_patterns.push_back(compiled.value());
                     const auto result = sec::scan("token secret-42", config);
                     require(result.sanitized == "token [REDACTED]", "got " + result.sanitized);
                     require(result.analysis.violations[0].category ==
                                 sec::ThreatCategory::SuspiciousPattern,
                             "custom matches are suspicious patterns");
                     require(result.analysis.violations[0].severity == sec::Severity::High,
                             "custom severity honoured");
                     require(sec::sanitize(result.sanitized, config) == result.sanitized,
                             "custom tag output is stable");

                     const auto defaulted = sec::compile_custom_pattern("x+");
                     require(defaulted.ok() && defaulted.value().tag == "[CUSTOM-PATTERN]",
                             "default tag expected");
                     require(!sec::compile_custom_pattern("(").ok(), "bad regex rejected");
                     require(!sec::compile_custom_pattern("").ok(), "empty pattern rejected");
                   }});

  tests.push_back({"security_violation_callback", [] {
                     std::size_t calls = 0;
                     sec::SanitizationConfig config;
                     config.on_violation = [&calls](const sec::SecurityViolation &) { ++calls; };
                     (void)sec::scan("$(rm -rf /)", config);
                     require(calls == 3, "callback per violation, got " + std::to_string(calls));
                   }});

  tests.push_back({"security_throwing_callback_is_disabled", [] {
                     const testing::ScopedCapture capture;
                     std::size_t calls = 0;
                     sec::SanitizationConfig config;
                     config.on_violation = [&calls](const sec::SecurityViolation &) {
                       ++calls;
                       throw std::runtime_error("sink down");
                     };
                     const auto analysis = sec::analyze("$(rm -rf /)", config);
                     require(calls == 1, "callback disabled after the first failure");
                     require(analysis.violations.size() == 3, "analysis still complete");
                     require(capture.observer()
                                     .count_events<wardline::observability::ErrorEvent>() == 1,
                             "callback failure reported once");
                   }});

  tests.push_back({"security_malformed_utf8_is_repaired", [] {
                     const auto result = sec::scan("ab\xFF");
                     require(result.sanitized == "ab\xEF\xBF\xBD", "invalid byte replaced");
                     require(result.analysis.has_category(sec::ThreatCategory::MalformedInput),
                             "malformed input reported");
                     require(result.analysis.risk_score == 3, "malformed input is low");
                   }});

  tests.push_back({"security_recorded_violations_are_capped", [] {
                     std::string input;
                     for (int i = 0; i < 300; ++i) {
                       input += "\x01x";
                     }
                     const auto analysis = sec::analyze(input);
                     require(analysis.violations.size() == sec::kMaxRecordedViolations,
                             "recorded list capped");
                     require(analysis.suppressed_violations == 44, "overflow counted");
                     require(analysis.total_violations() == 300, "total includes overflow");
                     require(analysis.risk_score == sec::kMaxRiskScore, "score capped at 100");
                   }});

  tests.push_back({"security_value_overloads", [] {
                     const auto number = sec::scan(mem::Value::number(5));
                     require(number.sanitized.empty(), "non-strings sanitize to empty text");
                     require(number.analysis.violations.empty(), "no violations for non-strings");
                     require(sec::sanitize(mem::Value::string("\x1B[31m")) == "[ANSI-CSI]",
                             "string values are sanitized");
                   }});

  tests.push_back({"security_log_report_flags_and_warnings", [] {
                     const auto report = sec::analyze_log_security("user\nadmin login %s");
                     require(report.sanitized == "user[LF]admin login [FORMAT]",
                             "got " + report.sanitized);
                     require(report.has_line_injection && report.has_format_strings,
                             "line and format flags expected");
                     require(!report.has_ansi_escapes && !report.has_unicode_attacks,
                             "unrelated flags stay clear");
                     require(report.warnings.size() == 2, "one warning per flag");

                     const auto truncated = sec::analyze_log_security(std::string(3000, 'z'));
                     require(!truncated.warnings.empty() &&
                                 truncated.warnings.back() == "message truncated to 2000 bytes",
                             "truncation warning expected");
                   }});

  tests.push_back({"security_scoring_helpers", [] {
                     require(sec::severity_points(sec::Severity::Critical) == 30, "critical");
                     require(sec::severity_points(sec::Severity::High) == 15, "high");
                     require(sec::severity_points(sec::Severity::Medium) == 8, "medium");
                     require(sec::severity_points(sec::Severity::Low) == 3, "low");
                     require(sec::risk_level_for(0) == sec::RiskLevel::Low, "0 is low");
                     require(sec::risk_level_for(39) == sec::RiskLevel::Medium, "39 is medium");
                     require(sec::risk_level_for(40) == sec::RiskLevel::High, "40 is high");
                     require(sec::risk_level_for(70) == sec::RiskLevel::Critical, "70 critical");
                     require(sec::risk_level_name(sec::RiskLevel::High) == "high", "name");

                     const auto long_span = sec::make_violation(
                         sec::ThreatCategory::Url, sec::Severity::Low, std::string(100, 'u'), 0);
                     require(long_span.original_span.size() == sec::kMaxSpanBytes,
                             "span capped at 64 bytes");
                   }});

  tests.push_back({"security_input_analysis", [] {
                     const auto traversal = sec::analyze_input_security("../../etc/passwd");
                     require(traversal.has_category(sec::ThreatCategory::PathTraversal),
                             "traversal expected");
                     require(traversal.risk_score == 60,
                             "traversal and sensitive file, got " +
                                 std::to_string(traversal.risk_score));
                     require(traversal.risk_level == sec::RiskLevel::High, "high level");

                     require(sec::analyze_input_security("my-project").risk_score == 0,
                             "plain name is clean");
                     require(sec::analyze_input_security("rm -rf /tmp")
                                 .has_category(sec::ThreatCategory::CommandInjection),
                             "dangerous command flagged");
                     require(sec::analyze_input_security("<script>alert(1)</script>")
                                 .has_category(sec::ThreatCategory::ScriptInjection),
                             "script flagged");
                     require(sec::analyze_input_security("__proto__")
                                 .has_category(sec::ThreatCategory::ScriptInjection),
                             "prototype pollution flagged");
                   }});

  tests.push_back({"security_path_and_command_predicates", [] {
                     require(sec::is_path_safe("src/main.cpp"), "relative path is safe");
                     require(!sec::is_path_safe(""), "empty path is unsafe");
                     require(!sec::is_path_safe("../x"), "traversal unsafe");
                     require(!sec::is_path_safe("/etc/hosts"), "absolute unsafe");
                     require(!sec::is_path_safe("a/%2e%2e/b"), "encoded traversal unsafe");
                     require(!sec::is_path_safe("\xEF\xBC\x8E\xEF\xBC\x8E/x"),
                             "full-width dots unsafe");
                     require(!sec::is_path_safe("C:\\temp"), "drive path unsafe");
                     require(!sec::is_path_safe("~other/x"), "home of another user unsafe");
                     require(sec::contains_encoded_path_sequence("a/%2E/b"), "encoded dot");
                     require(!sec::contains_encoded_path_sequence("caf\xC3\xA9/x"),
                             "accented letters are not encodings");

                     require(sec::is_command_safe("build"), "plain word is safe");
                     require(sec::is_command_safe("echo hi"), "harmless command is safe");
                     require(!sec::is_command_safe("ls; rm"), "metacharacters unsafe");
                     require(!sec::is_command_safe("sudo make"), "privilege unsafe");
                     require(!sec::is_command_safe("curl http://x"), "network tool unsafe");
                     require(!sec::is_command_safe("LD_PRELOAD=x app"), "env injection unsafe");
                   }});
}
