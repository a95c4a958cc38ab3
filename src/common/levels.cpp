#include "wardline/common/levels.hpp"

#include "wardline/common/fs.hpp"

namespace wardline::common {

std::string_view severity_name(const Severity severity) {
  switch (severity) {
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  case Severity::Critical:
    return "critical";
  }
  return "low";
}

std::optional<Severity> parse_severity(const std::string &value) {
  const std::string normalized = to_lower(trim(value));
  if (normalized == "low") {
    return Severity::Low;
  }
  if (normalized == "medium") {
    return Severity::Medium;
  }
  if (normalized == "high") {
    return Severity::High;
  }
  if (normalized == "critical") {
    return Severity::Critical;
  }
  return std::nullopt;
}

std::string_view protection_level_name(const ProtectionLevel level) {
  switch (level) {
  case ProtectionLevel::Permissive:
    return "permissive";
  case ProtectionLevel::Standard:
    return "standard";
  case ProtectionLevel::Strict:
    return "strict";
  }
  return "standard";
}

std::optional<ProtectionLevel> parse_protection_level(const std::string &value) {
  const std::string normalized = to_lower(trim(value));
  if (normalized == "permissive") {
    return ProtectionLevel::Permissive;
  }
  if (normalized == "standard") {
    return ProtectionLevel::Standard;
  }
  if (normalized == "strict") {
    return ProtectionLevel::Strict;
  }
  return std::nullopt;
}

} // namespace wardline::common
