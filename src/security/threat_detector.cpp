#include "wardline/security/threat_detector.hpp"

#include "wardline/common/fs.hpp"
#include "wardline/common/utf8.hpp"
#include "wardline/memory/protection_manager.hpp"
#include "wardline/observability/global.hpp"
#include "wardline/security/control_sequences.hpp"
#include "wardline/security/patterns.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <regex>
#include <utility>

namespace wardline::security {

namespace {

constexpr std::size_t kHardCapFactor = 8;

constexpr std::array<std::string_view, 18> kBuiltinMarkers = {
    "[ANSI-CSI]", "[OSC-CMD]",    "[DCS-CMD]",     "[TERM-RESET]", "[BIDI]",
    "[CONFUSABLE]", "[SHELL-CMD]", "[EVAL-ATTEMPT]", "[FORMAT]",    "[URL]",
    "[FILE-URL]", "[NULL]",       "[WHITESPACE]",  "[CUSTOM-PATTERN]", "[CRLF]",
    "[CR]",       "[LF]",         "[TRUNCATED]",
};

// A scheme only counts at a word boundary, so a tag never lands inside a word.
const std::regex &link_pattern() {
  static const std::regex pattern(R"(\b(https?|file)://)",
                                  std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
  return pattern;
}

using OffsetMap = std::vector<std::size_t>;

// Builds a pass output alongside the input offset of each of its bytes. The
// map carries one trailing entry for the end of the text.
class MappedText {
public:
  explicit MappedText(const OffsetMap &source) : source_(source) {}

  void copy(const std::string_view text, const std::size_t offset, const std::size_t length) {
    text_.append(text.substr(offset, length));
    origins_.insert(origins_.end(), source_.begin() + static_cast<std::ptrdiff_t>(offset),
                    source_.begin() + static_cast<std::ptrdiff_t>(offset + length));
  }

  void insert(const std::string_view tag, const std::size_t offset) {
    text_.append(tag);
    origins_.insert(origins_.end(), tag.size(), source_[offset]);
  }

  std::pair<std::string, OffsetMap> finish() {
    origins_.push_back(source_.back());
    return {std::move(text_), std::move(origins_)};
  }

private:
  const OffsetMap &source_;
  std::string text_;
  OffsetMap origins_;
};

class Pipeline {
public:
  explicit Pipeline(const SanitizationConfig &config) : config_(config) {}

  SanitizationResult run(const std::string_view input) {
    std::string text = length_gate(input);
    text = control_pass(text);
    text = unicode_pass(text);
    text = injection_pass(std::move(text));
    if (config_.protection_level != ProtectionLevel::Permissive) {
      text = network_pass(text);
    }
    text = line_pass(text);
    if (result_.truncated) {
      text += kTruncatedMarker;
    }
    result_.sanitized = std::move(text);
    publish();
    return std::move(result_);
  }

private:
  // Offsets arrive relative to the text the current pass reads and are stored
  // relative to the caller's input.
  void record(SecurityViolation violation) {
    violation.offset = origins_[violation.offset];
    found_.push_back(std::move(violation));
  }

  void publish() {
    std::stable_sort(found_.begin(), found_.end(),
                     [](const SecurityViolation &a, const SecurityViolation &b) {
                       return a.offset < b.offset;
                     });
    for (auto &violation : found_) {
      if (config_.on_violation && callback_enabled_) {
        try {
          config_.on_violation(violation);
        } catch (const std::exception &ex) {
          callback_enabled_ = false;
          observability::record_error("sanitizer",
                                      std::string("violation callback failed: ") + ex.what());
        }
      }
      result_.analysis.record(std::move(violation));
    }
    found_.clear();
  }

  void adopt(std::pair<std::string, OffsetMap> &&mapped, std::string &text) {
    text = std::move(mapped.first);
    origins_ = std::move(mapped.second);
  }

  std::string replace_spans(const std::string &text, const std::vector<MatchSpan> &spans,
                            const std::string &tag) {
    MappedText out(origins_);
    std::size_t cursor = 0;
    for (const auto &span : spans) {
      out.copy(text, cursor, span.offset - cursor);
      out.insert(tag, span.offset);
      cursor = span.offset + span.length;
    }
    out.copy(text, cursor, text.size() - cursor);
    std::string replaced;
    adopt(out.finish(), replaced);
    return replaced;
  }

  std::size_t marker_length_at(const std::string_view text, const std::size_t index) const {
    if (text[index] != '[') {
      return 0;
    }
    const std::string_view rest = text.substr(index);
    for (const auto marker : kBuiltinMarkers) {
      if (common::starts_with(rest, marker)) {
        return marker.size();
      }
    }
    for (const auto &custom : config_.custom_patterns) {
      if (!custom.tag.empty() && common::starts_with(rest, custom.tag)) {
        return custom.tag.size();
      }
    }
    return 0;
  }

  // Invalid sequences become U+FFFD, each mapped to the byte it replaces.
  std::string repair(const std::string_view input) {
    std::string text;
    text.reserve(input.size());
    origins_.clear();
    origins_.reserve(input.size() + 1);
    std::size_t first_invalid = std::string::npos;
    std::size_t index = 0;
    while (index < input.size()) {
      const std::size_t start = index;
      std::uint32_t cp = 0;
      if (common::decode_utf8(input, index, cp)) {
        text.append(input.substr(start, index - start));
      } else {
        if (first_invalid == std::string::npos) {
          first_invalid = text.size();
        }
        common::append_utf8(text, common::kReplacementCharacter);
      }
      origins_.insert(origins_.end(), text.size() - origins_.size(), start);
    }
    origins_.push_back(input.size());
    if (first_invalid != std::string::npos) {
      record(make_violation(ThreatCategory::MalformedInput, Severity::Low, input, first_invalid));
    }
    return text;
  }

  // Only bytes outside existing markers count towards max_input_length, so a
  // sanitized text passes the gate unchanged.
  std::string length_gate(const std::string_view input) {
    std::string text = repair(input);

    const std::size_t limit = config_.max_input_length;
    const std::size_t hard_cap = limit * kHardCapFactor;
    std::size_t counted = 0;
    std::size_t index = 0;
    std::size_t cut = std::string::npos;
    while (index < text.size()) {
      const std::size_t marker = marker_length_at(text, index);
      if (index >= hard_cap || (marker > 0 && index + marker > hard_cap)) {
        cut = index;
        break;
      }
      if (marker > 0) {
        index += marker;
        continue;
      }
      if (counted == limit) {
        cut = index;
        break;
      }
      ++counted;
      ++index;
    }

    if (cut == std::string::npos) {
      return text;
    }
    result_.truncated = true;
    text = memory::truncate_text(text, cut, "");
    origins_.resize(text.size() + 1);
    return text;
  }

  std::string control_pass(const std::string &text) {
    ControlScanResult scanned = scan_control_sequences(text, config_);
    for (auto &violation : scanned.violations) {
      record(std::move(violation));
    }
    OffsetMap mapped;
    mapped.reserve(scanned.origins.size() + 1);
    for (const auto origin : scanned.origins) {
      mapped.push_back(origins_[origin]);
    }
    mapped.push_back(origins_.back());
    origins_ = std::move(mapped);
    return std::move(scanned.output);
  }

  std::string unicode_pass(const std::string &text) {
    MappedText out(origins_);
    std::size_t index = 0;
    std::size_t last_removed_end = std::string::npos;
    SecurityViolation pending_zero_width;
    bool has_pending = false;

    const auto flush_pending = [&]() {
      if (has_pending) {
        record(std::move(pending_zero_width));
        has_pending = false;
      }
    };

    while (index < text.size()) {
      const std::size_t start = index;
      std::uint32_t cp = 0;
      const bool valid = common::decode_utf8(text, index, cp);
      const std::string_view raw = std::string_view(text).substr(start, index - start);
      if (valid && is_zero_width(cp)) {
        if (has_pending && last_removed_end == start) {
          if (pending_zero_width.original_span.size() + raw.size() <= kMaxSpanBytes) {
            pending_zero_width.original_span.append(raw);
          }
        } else {
          flush_pending();
          pending_zero_width = make_violation(ThreatCategory::ZeroWidth, Severity::Low, raw, start);
          has_pending = true;
        }
        last_removed_end = index;
        continue;
      }
      if (valid && is_bidi_control(cp)) {
        flush_pending();
        const std::string tag(default_tag(ThreatCategory::BidiOverride));
        out.insert(tag, start);
        record(make_violation(ThreatCategory::BidiOverride, Severity::Critical, raw, start, tag));
        continue;
      }
      out.copy(text, start, index - start);
    }
    flush_pending();

    std::string stripped;
    adopt(out.finish(), stripped);
    if (config_.protection_level == ProtectionLevel::Permissive) {
      return stripped;
    }
    const std::vector<MatchSpan> confusables = find_confusables(stripped);
    if (confusables.empty()) {
      return stripped;
    }
    const std::string tag(default_tag(ThreatCategory::Confusable));
    for (const auto &span : confusables) {
      record(make_violation(ThreatCategory::Confusable, Severity::High,
                            std::string_view(stripped).substr(span.offset, span.length),
                            span.offset, tag));
    }
    return replace_spans(stripped, confusables, tag);
  }

  std::string apply(std::string text, const std::vector<MatchSpan> &spans,
                    const ThreatCategory category, const Severity severity,
                    const PatternAction action, const std::string &tag) {
    const std::string_view view(text);
    for (const auto &span : spans) {
      record(make_violation(category, severity, view.substr(span.offset, span.length),
                            span.offset, action == PatternAction::Replace ? tag : ""));
    }
    if (action == PatternAction::Flag || spans.empty()) {
      return text;
    }
    return replace_spans(text, spans, tag);
  }

  std::string injection_pass(std::string text) {
    for (const auto &entry : injection_patterns()) {
      std::vector<MatchSpan> spans;
      try {
        spans = find_matches(entry, text);
      } catch (const std::regex_error &ex) {
        observability::record_error("sanitizer", std::string("pattern '") + entry.label +
                                                     "' skipped: " + ex.what());
        continue;
      }
      text = apply(std::move(text), spans, entry.category, entry.severity, entry.action,
                   entry.tag);
    }
    for (const auto &custom : config_.custom_patterns) {
      std::vector<MatchSpan> spans;
      try {
        spans = find_regex_matches(custom.regex, text);
      } catch (const std::regex_error &ex) {
        observability::record_error("sanitizer", "custom pattern '" + custom.source +
                                                     "' skipped: " + ex.what());
        continue;
      }
      text = apply(std::move(text), spans, ThreatCategory::SuspiciousPattern, custom.severity,
                   PatternAction::Replace, custom.tag);
    }
    return text;
  }

  // Links are kept readable; a tag in front marks them. Links that already
  // carry a tag are skipped.
  std::string network_pass(const std::string &text) {
    const std::vector<MatchSpan> links = find_regex_matches(link_pattern(), text);
    if (links.empty()) {
      return text;
    }
    const std::string_view view(text);
    MappedText out(origins_);
    std::size_t cursor = 0;
    for (const auto &link : links) {
      const bool is_file = view[link.offset] == 'f' || view[link.offset] == 'F';
      const ThreatCategory category = is_file ? ThreatCategory::FileUrl : ThreatCategory::Url;
      const std::string tag(default_tag(category));
      out.copy(view, cursor, link.offset - cursor);
      cursor = link.offset;
      const std::string_view before = view.substr(0, link.offset);
      if (common::ends_with(before, default_tag(ThreatCategory::Url)) ||
          common::ends_with(before, default_tag(ThreatCategory::FileUrl))) {
        continue;
      }
      std::size_t end = view.find_first_of(" \t\r\n", link.offset);
      if (end == std::string_view::npos) {
        end = view.size();
      }
      out.insert(tag, link.offset);
      record(make_violation(category, is_file ? Severity::Medium : Severity::Low,
                            view.substr(link.offset, end - link.offset), link.offset, tag));
    }
    out.copy(view, cursor, view.size() - cursor);
    std::string tagged;
    adopt(out.finish(), tagged);
    return tagged;
  }

  std::string line_pass(const std::string &text) {
    MappedText out(origins_);
    const std::size_t threshold = config_.whitespace_flood_threshold;
    std::size_t i = 0;
    while (i < text.size()) {
      const char c = text[i];
      if (c == '\r' && !config_.preserve_formatting) {
        const bool crlf = i + 1 < text.size() && text[i + 1] == '\n';
        emit_line_tag(out, crlf ? "[CRLF]" : "[CR]", crlf ? "\r\n" : "\r", i);
        i += crlf ? 2 : 1;
      } else if (c == '\n' && !config_.preserve_formatting) {
        emit_line_tag(out, "[LF]", "\n", i);
        ++i;
      } else if (c == '\0') {
        const std::string tag(default_tag(ThreatCategory::NullByte));
        out.insert(tag, i);
        record(make_violation(ThreatCategory::NullByte, Severity::High, std::string_view("\0", 1),
                              i, tag));
        ++i;
      } else if (c == ' ' || c == '\t') {
        std::size_t j = i;
        while (j < text.size() && (text[j] == ' ' || text[j] == '\t')) {
          ++j;
        }
        if (threshold > 0 && j - i >= threshold) {
          const std::string tag(default_tag(ThreatCategory::WhitespaceFlood));
          out.insert(tag, i);
          record(make_violation(ThreatCategory::WhitespaceFlood, Severity::Low,
                                std::string_view(text).substr(i, j - i), i, tag));
        } else {
          out.copy(text, i, j - i);
        }
        i = j;
      } else {
        out.copy(text, i, 1);
        ++i;
      }
    }
    std::string lined;
    adopt(out.finish(), lined);
    return lined;
  }

  void emit_line_tag(MappedText &out, const std::string &tag, const std::string_view raw,
                     const std::size_t offset) {
    out.insert(tag, offset);
    record(make_violation(ThreatCategory::CrLf, Severity::Low, raw, offset, tag));
  }

  const SanitizationConfig &config_;
  SanitizationResult result_;
  OffsetMap origins_;
  std::vector<SecurityViolation> found_;
  bool callback_enabled_ = true;
};

const std::string &coerce(const memory::Value &value) {
  static const std::string empty;
  return value.is_string() ? value.as_string() : empty;
}

bool has_any(const RiskAnalysis &analysis, std::initializer_list<ThreatCategory> categories) {
  for (const auto category : categories) {
    if (analysis.has_category(category)) {
      return true;
    }
  }
  return false;
}

} // namespace

SanitizationResult scan(const std::string_view text, const SanitizationConfig &config) {
  return Pipeline(config).run(text);
}

SanitizationResult scan(const memory::Value &value, const SanitizationConfig &config) {
  return scan(std::string_view(coerce(value)), config);
}

std::string sanitize(const std::string_view text, const SanitizationConfig &config) {
  return scan(text, config).sanitized;
}

std::string sanitize(const memory::Value &value, const SanitizationConfig &config) {
  return scan(value, config).sanitized;
}

RiskAnalysis analyze(const std::string_view text, const SanitizationConfig &config) {
  return scan(text, config).analysis;
}

RiskAnalysis analyze(const memory::Value &value, const SanitizationConfig &config) {
  return scan(value, config).analysis;
}

LogSecurityReport analyze_log_security(const std::string_view text,
                                       const SanitizationConfig &config) {
  SanitizationResult scanned = scan(text, config);
  LogSecurityReport report;
  const RiskAnalysis &analysis = scanned.analysis;

  report.has_ansi_escapes =
      has_any(analysis, {ThreatCategory::AnsiCsi, ThreatCategory::OscCommand,
                         ThreatCategory::DcsCommand, ThreatCategory::Hyperlink});
  report.has_control_chars =
      has_any(analysis, {ThreatCategory::ControlChar, ThreatCategory::NullByte});
  report.has_line_injection = has_any(analysis, {ThreatCategory::CrLf});
  report.has_format_strings = has_any(analysis, {ThreatCategory::FormatString});
  report.has_terminal_manipulation =
      has_any(analysis, {ThreatCategory::TerminalReset, ThreatCategory::OscCommand,
                         ThreatCategory::DcsCommand, ThreatCategory::Hyperlink});
  report.has_command_execution =
      has_any(analysis, {ThreatCategory::ShellCommand, ThreatCategory::EvalAttempt,
                         ThreatCategory::CommandInjection, ThreatCategory::PrivilegeEscalation});
  report.has_unicode_attacks =
      has_any(analysis, {ThreatCategory::BidiOverride, ThreatCategory::ZeroWidth,
                         ThreatCategory::Confusable});

  if (report.has_ansi_escapes) {
    report.warnings.emplace_back("ANSI escape sequences removed");
  }
  if (report.has_control_chars) {
    report.warnings.emplace_back("control characters removed");
  }
  if (report.has_line_injection) {
    report.warnings.emplace_back("line breaks escaped to prevent log forging");
  }
  if (report.has_format_strings) {
    report.warnings.emplace_back("format specifiers neutralized");
  }
  if (report.has_terminal_manipulation) {
    report.warnings.emplace_back("terminal manipulation sequence blocked");
  }
  if (report.has_command_execution) {
    report.warnings.emplace_back("command execution attempt detected");
  }
  if (report.has_unicode_attacks) {
    report.warnings.emplace_back("unicode spoofing characters neutralized");
  }
  if (scanned.truncated) {
    report.warnings.emplace_back("message truncated to " +
                                 std::to_string(config.max_input_length) + " bytes");
  }

  report.sanitized = std::move(scanned.sanitized);
  report.analysis = std::move(scanned.analysis);
  return report;
}

} // namespace wardline::security
