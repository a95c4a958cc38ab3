#include "wardline/security/sanitize_config.hpp"

namespace wardline::security {

SanitizationConfig sanitization_preset(const ProtectionLevel level) {
  SanitizationConfig config;
  config.protection_level = level;
  switch (level) {
  case ProtectionLevel::Permissive:
    config.preserve_formatting = true;
    config.whitespace_flood_threshold = 40;
    config.max_input_length = 10000;
    break;
  case ProtectionLevel::Standard:
    break;
  case ProtectionLevel::Strict:
    config.whitespace_flood_threshold = 10;
    config.max_input_length = 1000;
    break;
  }
  return config;
}

const SanitizationConfig &log_sanitization_config() {
  static const SanitizationConfig config = [] {
    SanitizationConfig built = sanitization_preset(ProtectionLevel::Standard);
    built.max_input_length = 4096;
    return built;
  }();
  return config;
}

common::Result<CustomPattern> compile_custom_pattern(const std::string &expression,
                                                     const std::string &tag,
                                                     const Severity severity) {
  if (expression.empty()) {
    return common::Result<CustomPattern>::failure("custom pattern is empty");
  }
  CustomPattern pattern;
  try {
    pattern.regex = std::regex(expression, std::regex::ECMAScript);
  } catch (const std::regex_error &error) {
    return common::Result<CustomPattern>::failure("invalid custom pattern '" + expression +
                                                  "': " + error.what());
  }
  if (!tag.empty()) {
    pattern.tag = tag;
  }
  pattern.severity = severity;
  pattern.source = expression;
  return common::Result<CustomPattern>::success(std::move(pattern));
}

} // namespace wardline::security
