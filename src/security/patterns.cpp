#include "wardline/security/patterns.hpp"

#include "wardline/common/utf8.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace wardline::security {

namespace {

constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::optimize;
constexpr auto kRegexFlagsIcase = std::regex::ECMAScript | std::regex::optimize | std::regex::icase;

bool search(const std::regex &regex, const std::string_view text) {
  return std::regex_search(text.data(), text.data() + text.size(), regex);
}

std::string binary_alternation() {
  std::string joined;
  for (const auto binary : known_binaries()) {
    if (!joined.empty()) {
      joined += '|';
    }
    joined += binary;
  }
  return joined;
}

PatternEntry regex_entry(const char *label, const ThreatCategory category, const Severity severity,
                         const PatternAction action, const std::string &expression,
                         const std::regex::flag_type flags = kRegexFlags) {
  PatternEntry entry{label, category, severity, action, "", std::nullopt, nullptr};
  if (action == PatternAction::Replace) {
    entry.tag = std::string(default_tag(category));
  }
  entry.regex.emplace(expression, flags);
  return entry;
}

PatternEntry scanner_entry(const char *label, const ThreatCategory category,
                           const Severity severity, const SpanScanner scanner) {
  return PatternEntry{label,        category, severity, PatternAction::Replace,
                      std::string(default_tag(category)), std::nullopt, scanner};
}

struct LookalikeEntry {
  std::uint32_t cp;
  char latin;
};

// Cyrillic and Greek letters rendered identically to a Latin letter in common
// fonts. Sorted by code point.
constexpr std::array<LookalikeEntry, 50> kLookalikes = {{
    {0x0391, 'A'}, {0x0392, 'B'}, {0x0395, 'E'}, {0x0396, 'Z'}, {0x0397, 'H'},
    {0x0399, 'I'}, {0x039A, 'K'}, {0x039C, 'M'}, {0x039D, 'N'}, {0x039F, 'O'},
    {0x03A1, 'P'}, {0x03A4, 'T'}, {0x03A5, 'Y'}, {0x03A7, 'X'}, {0x03B1, 'a'},
    {0x03BD, 'v'}, {0x03BF, 'o'}, {0x03C1, 'p'}, {0x0405, 'S'}, {0x0406, 'I'},
    {0x0408, 'J'}, {0x0410, 'A'}, {0x0412, 'B'}, {0x0415, 'E'}, {0x041A, 'K'},
    {0x041C, 'M'}, {0x041D, 'H'}, {0x041E, 'O'}, {0x0420, 'P'}, {0x0421, 'C'},
    {0x0422, 'T'}, {0x0425, 'X'}, {0x0430, 'a'}, {0x0435, 'e'}, {0x043E, 'o'},
    {0x0440, 'p'}, {0x0441, 'c'}, {0x0443, 'y'}, {0x0445, 'x'}, {0x0455, 's'},
    {0x0456, 'i'}, {0x0458, 'j'}, {0x04AE, 'Y'}, {0x04BB, 'h'}, {0x04C0, 'I'},
    {0x04CF, 'l'}, {0x0501, 'd'}, {0x051B, 'q'}, {0x051C, 'W'}, {0x051D, 'w'},
}};

bool is_latin_letter(const std::uint32_t cp) {
  if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) {
    return true;
  }
  return cp >= 0x00C0 && cp <= 0x024F && cp != 0x00D7 && cp != 0x00F7;
}

bool is_greek_or_cyrillic(const std::uint32_t cp) {
  return (cp >= 0x0370 && cp <= 0x03FF) || (cp >= 0x0400 && cp <= 0x052F);
}

bool is_token_char(const std::uint32_t cp) {
  return is_latin_letter(cp) || is_greek_or_cyrillic(cp) || (cp >= '0' && cp <= '9');
}

const std::vector<std::regex> &traversal_patterns() {
  static const std::vector<std::regex> patterns = {
      std::regex(R"((^|[/\\])\.\.($|[/\\]))", kRegexFlags),
      std::regex(R"((%2e|\.){2}(%2f|%5c|/|\\))", kRegexFlagsIcase),
      std::regex(R"((%252e|%2e|\.){2}(%252f|%255c))", kRegexFlagsIcase),
      std::regex(R"(%252e%252e|%25252e)", kRegexFlagsIcase),
      std::regex(R"(%c0%ae|%c0%af|%c1%9c|%c1%1c|%e0%80%ae)", kRegexFlagsIcase),
  };
  return patterns;
}

// Folds full-width and one-dot-leader lookalikes to ASCII and drops zero-width
// characters so disguised traversal sequences become visible.
std::string fold_path_lookalikes(const std::string_view text) {
  std::string folded;
  folded.reserve(text.size());
  std::size_t index = 0;
  while (index < text.size()) {
    const std::size_t start = index;
    std::uint32_t cp = 0;
    if (!common::decode_utf8(text, index, cp)) {
      folded.push_back(text[start]);
      continue;
    }
    if (is_zero_width(cp)) {
      continue;
    }
    switch (cp) {
    case 0xFF0E:
    case 0x2024:
    case 0xFE52:
      folded.push_back('.');
      break;
    case 0xFF0F:
    case 0x2215:
    case 0x2044:
      folded.push_back('/');
      break;
    case 0xFF3C:
    case 0x2216:
      folded.push_back('\\');
      break;
    default:
      folded.append(text.substr(start, index - start));
      break;
    }
  }
  return folded;
}

const std::regex &env_injection_pattern() {
  static const std::regex pattern(
      R"(\b(PATH|LD_PRELOAD|LD_LIBRARY_PATH|BASH_ENV|IFS)\s*=|\$IFS\b|\$\{IFS\})", kRegexFlags);
  return pattern;
}

const std::regex &dangerous_command_pattern() {
  static const std::regex pattern(
      R"(\b(rm|fdisk|mkfs|dd|curl|wget|nc|netcat|telnet|ssh|ftp|tftp|eval|exec|system)\s)",
      kRegexFlagsIcase);
  return pattern;
}

const std::regex &script_injection_pattern() {
  static const std::regex pattern(
      R"(\b(eval|Function|setTimeout|setInterval)\s*\(|<\s*script\b|javascript\s*:|vbscript\s*:|data:[^;,]*;base64)",
      kRegexFlagsIcase);
  return pattern;
}

const std::regex &privilege_pattern() {
  static const std::regex pattern(
      R"(\b(sudo|su|doas|runas|pkexec)\s|\bbypassuac\b|\bchmod\s+([0-7]*[4-7][0-7]{3}|[ugo]*\+s)\b|\bchown\s+root\b|\b(systemctl|service)\s+\S|\breg\s+add\b|\b(insmod|modprobe|rmmod)\s)",
      kRegexFlagsIcase);
  return pattern;
}

const std::regex &sensitive_file_pattern() {
  static const std::regex pattern(
      R"(/etc/(passwd|shadow|sudoers|hosts)\b|/root/|/proc/self|\.ssh/|\bid_rsa\b|\\windows\\system32|\\config\\sam\b)",
      kRegexFlagsIcase);
  return pattern;
}

const std::regex &device_name_pattern() {
  static const std::regex pattern(R"((^|[/\\])(con|prn|aux|nul|com[1-9]|lpt[1-9])(\.[^/\\]*)?$)",
                                  kRegexFlagsIcase);
  return pattern;
}

const std::regex &prototype_pollution_pattern() {
  static const std::regex pattern(
      R"(__proto__|\bconstructor\s*(\.|\[)\s*['"]?prototype|\bprototype\s*\[)", kRegexFlags);
  return pattern;
}

bool contains_null(const std::string_view text) {
  return text.find('\0') != std::string_view::npos ||
         text.find("%00") != std::string_view::npos;
}

bool contains_code_point(const std::string_view text, bool (*predicate)(std::uint32_t)) {
  std::size_t index = 0;
  while (index < text.size()) {
    std::uint32_t cp = 0;
    if (common::decode_utf8(text, index, cp) && predicate(cp)) {
      return true;
    }
  }
  return false;
}

bool has_bidi(const std::string_view text) { return contains_code_point(text, is_bidi_control); }
bool has_zero_width(const std::string_view text) { return contains_code_point(text, is_zero_width); }
bool has_confusable(const std::string_view text) { return !find_confusables(text).empty(); }
bool has_env_injection(const std::string_view text) { return search(env_injection_pattern(), text); }
bool has_dangerous_command(const std::string_view text) {
  return search(dangerous_command_pattern(), text);
}
bool has_script_injection(const std::string_view text) {
  return search(script_injection_pattern(), text);
}
bool has_privilege_escalation(const std::string_view text) {
  return search(privilege_pattern(), text);
}
bool has_device_name(const std::string_view text) { return search(device_name_pattern(), text); }
bool has_prototype_pollution(const std::string_view text) {
  return search(prototype_pollution_pattern(), text);
}

struct InputCheck {
  const char *label;
  ThreatCategory category;
  Severity severity;
  bool (*matches)(std::string_view);
};

const std::array<InputCheck, 14> kInputChecks = {{
    {"path traversal", ThreatCategory::PathTraversal, Severity::Critical, contains_path_traversal},
    {"absolute path", ThreatCategory::PathTraversal, Severity::High, is_absolute_path},
    {"shell metacharacters", ThreatCategory::CommandInjection, Severity::High,
     contains_shell_metacharacters},
    {"environment injection", ThreatCategory::CommandInjection, Severity::Critical,
     has_env_injection},
    {"dangerous command", ThreatCategory::CommandInjection, Severity::Critical,
     has_dangerous_command},
    {"script injection", ThreatCategory::ScriptInjection, Severity::Critical,
     has_script_injection},
    {"privilege escalation", ThreatCategory::PrivilegeEscalation, Severity::High,
     has_privilege_escalation},
    {"sensitive file", ThreatCategory::SuspiciousPattern, Severity::Critical,
     references_sensitive_file},
    {"windows device name", ThreatCategory::SuspiciousPattern, Severity::Medium, has_device_name},
    {"null byte", ThreatCategory::NullByte, Severity::High, contains_null},
    {"bidi control", ThreatCategory::BidiOverride, Severity::Critical, has_bidi},
    {"zero-width character", ThreatCategory::ZeroWidth, Severity::Low, has_zero_width},
    {"homograph", ThreatCategory::Confusable, Severity::High, has_confusable},
    {"prototype pollution", ThreatCategory::ScriptInjection, Severity::High,
     has_prototype_pollution},
}};

} // namespace

std::vector<MatchSpan> find_regex_matches(const std::regex &regex, const std::string_view text) {
  std::vector<MatchSpan> spans;
  const auto begin = std::cregex_iterator(text.data(), text.data() + text.size(), regex);
  for (auto it = begin; it != std::cregex_iterator(); ++it) {
    const auto &match = *it;
    if (match.length(0) <= 0) {
      continue;
    }
    spans.push_back(MatchSpan{static_cast<std::size_t>(match.position(0)),
                              static_cast<std::size_t>(match.length(0))});
  }
  return spans;
}

std::vector<MatchSpan> find_matches(const PatternEntry &entry, const std::string_view text) {
  if (entry.scanner != nullptr) {
    return entry.scanner(text);
  }
  if (entry.regex.has_value()) {
    return find_regex_matches(*entry.regex, text);
  }
  return {};
}

const std::vector<std::string_view> &known_binaries() {
  static const std::vector<std::string_view> binaries = {
      "rm",     "curl",   "wget",  "nc",    "netcat", "bash",     "sh",   "zsh",
      "fish",   "python3", "python", "perl", "ruby",   "node",     "php",  "cat",
      "chmod",  "chown",  "sudo",  "su",    "dd",     "mkfs",     "kill", "reboot",
      "shutdown", "eval", "exec",  "ssh",   "scp",    "ftp",      "telnet", "powershell",
      "cmd",    "nohup",  "xargs", "awk",   "base64",
  };
  return binaries;
}

std::vector<MatchSpan> find_command_substitutions(const std::string_view text) {
  std::vector<MatchSpan> candidates;
  std::vector<std::size_t> open;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '(') {
      open.push_back(i);
    } else if (text[i] == ')' && !open.empty()) {
      const std::size_t start = open.back();
      open.pop_back();
      if (start > 0 && text[start - 1] == '$') {
        candidates.push_back(MatchSpan{start - 1, i - start + 2});
      }
    }
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const MatchSpan &a, const MatchSpan &b) { return a.offset < b.offset; });
  std::vector<MatchSpan> outermost;
  std::size_t covered_until = 0;
  for (const auto &candidate : candidates) {
    if (!outermost.empty() && candidate.offset < covered_until) {
      continue;
    }
    outermost.push_back(candidate);
    covered_until = candidate.offset + candidate.length;
  }
  return outermost;
}

std::vector<MatchSpan> find_backtick_spans(const std::string_view text) {
  std::vector<MatchSpan> spans;
  std::size_t pos = text.find('`');
  while (pos != std::string_view::npos) {
    const std::size_t close = text.find('`', pos + 1);
    if (close == std::string_view::npos) {
      break;
    }
    spans.push_back(MatchSpan{pos, close - pos + 1});
    pos = text.find('`', close + 1);
  }
  return spans;
}

const std::vector<PatternEntry> &injection_patterns() {
  static const std::vector<PatternEntry> patterns = [] {
    std::vector<PatternEntry> built;
    built.push_back(regex_entry(
        "destructive command", ThreatCategory::CommandInjection, Severity::Critical,
        PatternAction::Flag,
        R"(\b(?:rm\s+-[a-zA-Z]*[rRf][a-zA-Z]*|mkfs(?:\.[a-z0-9]+)?\s|dd\s+if=|shred\s|format\s+[a-zA-Z]:|del\s+/[sfqSFQ])|:\(\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)"));
    built.push_back(regex_entry(
        "privilege escalation", ThreatCategory::PrivilegeEscalation, Severity::High,
        PatternAction::Flag,
        R"(\b(?:sudo|doas|pkexec|runas)\s|\bsu\s+(?:-|root\b)|\bchmod\s+(?:[0-7]*[4-7][0-7]{3}|[ugo]*\+s)\b|\bchown\s+root\b)",
        kRegexFlagsIcase));
    built.push_back(regex_entry(
        "dangerous binary in substitution", ThreatCategory::CommandInjection, Severity::High,
        PatternAction::Flag,
        R"((?:\$\(|`)\s*(?:rm|curl|wget|nc|netcat|bash|sh|zsh|python[0-9.]*|perl|ruby|node|php|chmod|chown|dd|mkfs|kill|reboot|shutdown|cat|sudo)\b)"));
    built.push_back(scanner_entry("command substitution", ThreatCategory::ShellCommand,
                                  Severity::Critical, find_command_substitutions));
    built.push_back(scanner_entry("backtick substitution", ThreatCategory::ShellCommand,
                                  Severity::Critical, find_backtick_spans));
    built.push_back(regex_entry("command chaining", ThreatCategory::ShellCommand, Severity::High,
                                PatternAction::Replace,
                                R"((?:;|&&|\|\|?)\s*(?:)" + binary_alternation() + R"()\b)"));
    // The parenthesis stays so the tag never changes how `$(...)` pairs up.
    built.push_back(regex_entry(
        "dynamic evaluation", ThreatCategory::EvalAttempt, Severity::Critical,
        PatternAction::Replace,
        R"(\b(?:eval|exec|Function|system|setTimeout|setInterval)\s*(?=\())"));
    built.push_back(regex_entry(
        "format specifier", ThreatCategory::FormatString, Severity::Medium,
        PatternAction::Replace,
        R"(%(?:\d+\$)?[-+#0]*(?:\d+|\*)?(?:\.(?:\d+|\*))?(?:hh|h|ll|l|z|j|t)?[sdiuxXnp])"));
    return built;
  }();
  return patterns;
}

bool is_bidi_control(const std::uint32_t cp) {
  return (cp >= 0x202A && cp <= 0x202E) || (cp >= 0x2066 && cp <= 0x2069) || cp == 0x061C;
}

bool is_zero_width(const std::uint32_t cp) {
  return (cp >= 0x200B && cp <= 0x200D) || cp == 0x2060 || cp == 0xFEFF;
}

std::optional<char> latin_lookalike(const std::uint32_t cp) {
  const auto it = std::lower_bound(
      kLookalikes.begin(), kLookalikes.end(), cp,
      [](const LookalikeEntry &entry, const std::uint32_t value) { return entry.cp < value; });
  if (it == kLookalikes.end() || it->cp != cp) {
    return std::nullopt;
  }
  return it->latin;
}

std::vector<MatchSpan> find_confusables(const std::string_view text) {
  std::vector<MatchSpan> spans;
  std::vector<MatchSpan> token_lookalikes;
  bool token_has_latin = false;

  const auto close_token = [&]() {
    if (token_has_latin) {
      spans.insert(spans.end(), token_lookalikes.begin(), token_lookalikes.end());
    }
    token_lookalikes.clear();
    token_has_latin = false;
  };

  std::size_t index = 0;
  while (index < text.size()) {
    const std::size_t start = index;
    std::uint32_t cp = 0;
    if (!common::decode_utf8(text, index, cp) || !is_token_char(cp)) {
      close_token();
      continue;
    }
    if (is_latin_letter(cp)) {
      token_has_latin = true;
    } else if (latin_lookalike(cp).has_value()) {
      token_lookalikes.push_back(MatchSpan{start, index - start});
    }
  }
  close_token();
  return spans;
}

bool contains_path_traversal(const std::string_view text) {
  const std::string folded = fold_path_lookalikes(text);
  for (const auto &pattern : traversal_patterns()) {
    if (search(pattern, text) || search(pattern, folded)) {
      return true;
    }
  }
  return false;
}

bool contains_encoded_path_sequence(const std::string_view text) {
  static const std::regex encoded(R"(%(2e|2f|5c|25|c0|c1|e0))", kRegexFlagsIcase);
  return search(encoded, text) || fold_path_lookalikes(text) != text;
}

bool is_absolute_path(const std::string_view text) {
  if (text.empty()) {
    return false;
  }
  if (text.front() == '/' || text.front() == '\\') {
    return true;
  }
  // `~` and `~user` both resolve against a home directory.
  if (text.front() == '~') {
    return true;
  }
  const char first = text.front();
  const bool drive_letter = text.size() >= 2 && text[1] == ':' &&
                            ((first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z'));
  return drive_letter && (text.size() == 2 || text[2] == '/' || text[2] == '\\');
}

bool contains_shell_metacharacters(const std::string_view text) {
  return text.find_first_of(";&|`$(){}[]<>") != std::string_view::npos;
}

bool references_sensitive_file(const std::string_view text) {
  return search(sensitive_file_pattern(), text);
}

RiskAnalysis analyze_input_security(const std::string_view input) {
  RiskAnalysis analysis;
  std::size_t replaced = 0;
  const std::string text = common::repair_utf8(input, replaced);
  if (replaced > 0) {
    analysis.record(make_violation(ThreatCategory::MalformedInput, Severity::Low, input, 0));
  }
  for (const auto &check : kInputChecks) {
    if (!check.matches(text)) {
      continue;
    }
    SecurityViolation violation = make_violation(check.category, check.severity, text, 0);
    violation.recommendation = std::string(check.label) + ": " + violation.recommendation;
    analysis.record(std::move(violation));
  }
  return analysis;
}

bool is_path_safe(const std::string_view path) {
  return !path.empty() && !contains_path_traversal(path) && !is_absolute_path(path) &&
         !references_sensitive_file(path) && !contains_null(path);
}

bool is_command_safe(const std::string_view command) {
  return !contains_shell_metacharacters(command) && !has_env_injection(command) &&
         !has_dangerous_command(command) && !has_privilege_escalation(command) &&
         !has_script_injection(command) && !contains_null(command);
}

} // namespace wardline::security
