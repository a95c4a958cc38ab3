#include "wardline/guard/error_guard.hpp"

#include "wardline/common/fs.hpp"
#include "wardline/memory/protection_manager.hpp"
#include "wardline/memory/size_estimator.hpp"
#include "wardline/observability/global.hpp"
#include "wardline/security/threat_detector.hpp"

namespace wardline::guard {

namespace {

using memory::MemoryConfig;
using memory::Value;
using memory::ValueKind;

constexpr std::string_view kMemoryViolationIndicator = " [TRUNCATED: Memory protection violation]";
constexpr std::string_view kLengthLimitIndicator = " [TRUNCATED: Length limit]";

memory::ErrorValue as_error_value(const Value &value) {
  if (value.kind() == ValueKind::Error) {
    return value.as_error();
  }
  memory::ErrorValue wrapped;
  wrapped.message = value.is_string() ? value.as_string() : "Error occurred";
  return wrapped;
}

// Each stack line is sanitized on its own so a line break inside a frame
// cannot forge an extra frame.
std::string sanitize_stack(const std::string &stack, const MemoryConfig &config) {
  const std::string limited = memory::truncate_stack(stack, config.max_stack_frames);
  if (limited.empty()) {
    return limited;
  }
  const security::SanitizationConfig sanitization = message_sanitization(config);
  std::string out;
  for (const auto &line : common::split(limited, '\n')) {
    if (!out.empty()) {
      out.push_back('\n');
    }
    out += security::sanitize(line, sanitization);
  }
  return out;
}

ProtectedContext failed_context(std::string warning) {
  ProtectedContext out;
  out.context = Value::object();
  out.context.as_object()->set("error", Value::string(std::string(kContextFailedMessage)));
  out.warnings.push_back(std::move(warning));
  out.truncated = true;
  return out;
}

} // namespace

security::SanitizationConfig message_sanitization(const MemoryConfig &config) {
  security::SanitizationConfig sanitization = security::sanitization_preset(config.protection_level);
  sanitization.max_input_length = static_cast<std::size_t>(config.max_message_length);
  return sanitization;
}

Value sanitize_error_with_memory_protection(const Value &error, const MemoryConfig &config) {
  const memory::ErrorValue source = as_error_value(error);
  const Value candidate = Value::error(source.message, source.stack, source.name);
  const security::SanitizationConfig sanitization = message_sanitization(config);

  bool safe = false;
  try {
    memory::MemoryProtectionManager manager(config);
    safe = manager.validate_object_size(candidate, "error-object").usage_level ==
           memory::UsageLevel::Safe;
  } catch (const memory::MemoryProtectionError &ex) {
    observability::record_error("guard", ex.what());
  }

  std::string name = security::sanitize(source.name, sanitization);
  if (name.empty()) {
    name = "Error";
  }

  if (safe) {
    return Value::error(security::sanitize(source.message, sanitization),
                        sanitize_stack(source.stack, config), name);
  }

  const std::string message = source.message.empty() ? "Error occurred" : source.message;
  const std::string truncated = memory::truncate_text(
      message, static_cast<std::size_t>(config.max_message_length), kMessageTruncatedNote);
  return Value::error(security::sanitize(truncated, sanitization), "", name);
}

std::string truncate_message_with_memory_protection(const std::string_view message,
                                                    const MemoryConfig &config) {
  if (message.empty()) {
    return "";
  }
  const security::SanitizationConfig sanitization = message_sanitization(config);
  const auto limit = static_cast<std::size_t>(config.max_message_length);
  if (message.size() <= limit) {
    return security::sanitize(message, sanitization);
  }

  MemoryConfig message_limits = config;
  message_limits.strict_mode = false;
  message_limits.max_object_size = config.max_message_length * 2 * memory::kStringUnitSize;
  const bool violation =
      !memory::analyze_memory(Value::string(std::string(message)), message_limits, "message")
           .violations.empty();
  const std::string_view indicator = violation ? kMemoryViolationIndicator : kLengthLimitIndicator;

  const std::size_t keep = limit > indicator.size() ? limit - indicator.size() : 0;
  std::string truncated = memory::truncate_text(message, keep, "");
  truncated += indicator;
  return security::sanitize(truncated, sanitization);
}

ProtectedContext process_context_with_memory_protection(const Value &context,
                                                        const MemoryConfig &config) {
  if (context.kind() != ValueKind::Object) {
    ProtectedContext out;
    out.context = Value::object();
    out.warnings.push_back("Context is not an object (" +
                           std::string(memory::value_kind_name(context.kind())) +
                           "); replaced with an empty object");
    out.truncated = true;
    return out;
  }

  for (const auto &property : context.as_object()->properties()) {
    if (!property.getter) {
      continue;
    }
    try {
      (void)memory::ObjectNode::read(property);
    } catch (const std::exception &ex) {
      return failed_context("Memory protection error: " +
                            truncate_message_with_memory_protection(ex.what(), config));
    } catch (...) {
      return failed_context("Memory protection error: accessor '" + property.key + "' failed");
    }
  }

  MemoryConfig bounded = config;
  bounded.max_object_size = config.max_context_size;

  ProtectedContext out;
  memory::MemoryAnalysis analysis;
  try {
    memory::MemoryProtectionManager manager(bounded);
    analysis = manager.validate_object_size(context, "log-context");
  } catch (const memory::MemoryProtectionError &ex) {
    analysis.usage_level = memory::UsageLevel::Exceeded;
    analysis.estimated_bytes = ex.violation().actual_size;
    out.warnings.push_back(std::string("Memory protection error: ") + ex.what());
  }

  if (analysis.violations.empty() && analysis.usage_level != memory::UsageLevel::Exceeded) {
    out.context = context;
    return out;
  }

  out.context = memory::truncate_for_memory(context, bounded);
  out.truncated = true;
  out.warnings.push_back("Context truncated due to memory protection (" +
                         std::to_string(analysis.estimated_bytes) + " > " +
                         std::to_string(config.max_context_size) + " bytes)");
  out.warnings.insert(out.warnings.end(), analysis.recommendations.begin(),
                      analysis.recommendations.end());
  return out;
}

} // namespace wardline::guard
