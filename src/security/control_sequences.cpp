#include "wardline/security/control_sequences.hpp"

#include <utility>

namespace wardline::security {

namespace {

constexpr unsigned char kEsc = 0x1B;
constexpr unsigned char kBel = 0x07;
constexpr unsigned char kDel = 0x7F;
constexpr std::size_t kNone = static_cast<std::size_t>(-1);

bool in_range(const unsigned char c, const unsigned char low, const unsigned char high) {
  return c >= low && c <= high;
}

class ControlScanner {
public:
  ControlScanner(const std::string_view text, const SanitizationConfig &config)
      : text_(text), config_(config) {
    result_.output.reserve(text.size());
    result_.origins.reserve(text.size());
  }

  ControlScanResult run() {
    std::size_t i = 0;
    while (i < text_.size()) {
      const auto c = at(i);
      if (c == kEsc && config_.detect_terminal_manipulation) {
        i = scan_escape(i);
      } else if (c < 0x20 || c == kDel) {
        i = scan_c0(i);
      } else if (c == 0xC2 && i + 1 < text_.size() && in_range(at(i + 1), 0x80, 0x9F)) {
        if (config_.allow_control_chars) {
          keep(i, 2);
        } else {
          drop(ThreatCategory::ControlChar, Severity::Medium, i, i + 2);
        }
        i += 2;
      } else {
        keep(i, 1);
        ++i;
      }
    }
    return std::move(result_);
  }

private:
  [[nodiscard]] unsigned char at(const std::size_t index) const {
    return static_cast<unsigned char>(text_[index]);
  }

  std::size_t scan_c0(const std::size_t i) {
    const auto c = at(i);
    switch (c) {
    case '\n':
    case '\r':
      keep(i, 1);
      return i + 1;
    case '\t':
      put(config_.preserve_formatting ? '\t' : ' ', i);
      return i + 1;
    case '\0':
      if (config_.allow_control_chars) {
        keep(i, 1);
      } else {
        drop(ThreatCategory::NullByte, Severity::High, i, i + 1);
      }
      return i + 1;
    default:
      if (config_.allow_control_chars) {
        keep(i, 1);
      } else {
        drop(ThreatCategory::ControlChar, Severity::Medium, i, i + 1);
      }
      return i + 1;
    }
  }

  std::size_t scan_escape(const std::size_t i) {
    if (i + 1 >= text_.size()) {
      drop(ThreatCategory::ControlChar, Severity::Medium, i, i + 1);
      return i + 1;
    }
    const auto next = at(i + 1);
    switch (next) {
    case 'P':
    case 'X':
    case '^':
    case '_':
      return scan_string_sequence(i, ThreatCategory::DcsCommand, false);
    case ']':
      return scan_string_sequence(i, ThreatCategory::OscCommand, true);
    case '[':
      return scan_csi(i);
    case 'c':
      tag(ThreatCategory::TerminalReset, Severity::High, i, i + 2);
      return i + 2;
    default:
      break;
    }

    std::size_t j = i + 1;
    while (j < text_.size() && in_range(at(j), 0x20, 0x2F)) {
      ++j;
    }
    if (j < text_.size() && in_range(at(j), 0x30, 0x7E)) {
      tag(ThreatCategory::AnsiCsi, Severity::Medium, i, j + 1);
      return j + 1;
    }
    drop(ThreatCategory::ControlChar, Severity::Medium, i, i + 1);
    return i + 1;
  }

  std::size_t scan_csi(const std::size_t i) {
    std::size_t j = i + 2;
    while (j < text_.size() && in_range(at(j), 0x30, 0x3F)) {
      ++j;
    }
    while (j < text_.size() && in_range(at(j), 0x20, 0x2F)) {
      ++j;
    }
    if (j < text_.size() && in_range(at(j), 0x40, 0x7E)) {
      const Severity severity = at(j) == 'm' ? Severity::Medium : Severity::High;
      tag(ThreatCategory::AnsiCsi, severity, i, j + 1);
      return j + 1;
    }
    tag(ThreatCategory::AnsiCsi, Severity::High, i, i + 2);
    return i + 2;
  }

  // DCS, SOS, PM and APC end at ST; OSC also ends at BEL. Nested sequences in
  // the payload are swallowed by the outer one.
  std::size_t scan_string_sequence(const std::size_t i, ThreatCategory category,
                                   const bool allow_bel) {
    const std::size_t end = find_terminator(i + 2, allow_bel);
    if (end == kNone) {
      tag(category, Severity::High, i, i + 2);
      return i + 2;
    }
    if (category == ThreatCategory::OscCommand && text_.substr(i + 2, 2) == "8;") {
      category = ThreatCategory::Hyperlink;
    }
    tag(category, Severity::High, i, end);
    return end;
  }

  std::size_t find_terminator(const std::size_t from, const bool allow_bel) {
    std::size_t &exhausted_from = allow_bel ? bel_or_st_exhausted_ : st_exhausted_;
    if (exhausted_from != kNone && from >= exhausted_from) {
      return kNone;
    }
    for (std::size_t j = from; j < text_.size(); ++j) {
      const auto c = at(j);
      if (allow_bel && c == kBel) {
        return j + 1;
      }
      if (j + 1 < text_.size()) {
        if (c == kEsc && at(j + 1) == '\\') {
          return j + 2;
        }
        if (c == 0xC2 && at(j + 1) == 0x9C) {
          return j + 2;
        }
      }
    }
    exhausted_from = from;
    return kNone;
  }

  void keep(const std::size_t start, const std::size_t length) {
    result_.output.append(text_.substr(start, length));
    for (std::size_t k = 0; k < length; ++k) {
      result_.origins.push_back(start + k);
    }
  }

  void put(const char c, const std::size_t origin) {
    result_.output.push_back(c);
    result_.origins.push_back(origin);
  }

  void tag(const ThreatCategory category, const Severity severity, const std::size_t start,
           const std::size_t end) {
    std::string replacement(default_tag(category));
    result_.output += replacement;
    result_.origins.insert(result_.origins.end(), replacement.size(), start);
    result_.violations.push_back(make_violation(category, severity,
                                                text_.substr(start, end - start), start,
                                                std::move(replacement)));
    last_drop_end_ = kNone;
  }

  // Adjacent removals of the same kind are reported as one run.
  void drop(const ThreatCategory category, const Severity severity, const std::size_t start,
            const std::size_t end) {
    if (last_drop_end_ == start && !result_.violations.empty() &&
        result_.violations.back().category == category) {
      auto &span = result_.violations.back().original_span;
      if (span.size() + (end - start) <= kMaxSpanBytes) {
        span.append(text_.substr(start, end - start));
      }
    } else {
      result_.violations.push_back(
          make_violation(category, severity, text_.substr(start, end - start), start));
    }
    last_drop_end_ = end;
  }

  std::string_view text_;
  const SanitizationConfig &config_;
  ControlScanResult result_;
  std::size_t last_drop_end_ = kNone;
  std::size_t st_exhausted_ = kNone;
  std::size_t bel_or_st_exhausted_ = kNone;
};

} // namespace

ControlScanResult scan_control_sequences(const std::string_view text,
                                         const SanitizationConfig &config) {
  return ControlScanner(text, config).run();
}

} // namespace wardline::security
