#include "wardline/memory/size_estimator.hpp"

#include "wardline/common/utf8.hpp"

namespace wardline::memory {

namespace {

constexpr std::uint64_t kDateTextUnits = 24;
constexpr std::size_t kScalarDeadlineStride = 256;

} // namespace

std::string truncate_stack(const std::string &stack, const std::uint32_t max_frames) {
  std::size_t lines = 0;
  std::size_t pos = 0;
  while (pos < stack.size()) {
    const std::size_t newline = stack.find('\n', pos);
    if (newline == std::string::npos) {
      return stack;
    }
    if (++lines >= max_frames) {
      return stack.substr(0, newline);
    }
    pos = newline + 1;
  }
  return stack;
}

std::uint64_t string_size(const std::string &text) {
  return kStringUnitSize * static_cast<std::uint64_t>(common::utf16_length(text));
}

std::uint64_t leaf_size(const Value &value, const std::uint32_t max_stack_frames) {
  switch (value.kind()) {
  case ValueKind::Undefined:
  case ValueKind::Null:
    return 0;
  case ValueKind::Bool:
    return kBooleanSize;
  case ValueKind::Number:
    return kNumberSize;
  case ValueKind::String:
    return string_size(value.as_string());
  case ValueKind::Array:
    return kArrayOverhead;
  case ValueKind::Object:
    return kObjectOverhead;
  case ValueKind::Date:
    return kObjectOverhead + kStringUnitSize * kDateTextUnits;
  case ValueKind::Regex: {
    const auto &regex = value.as_regex();
    return kObjectOverhead + string_size("/" + regex.source + "/" + regex.flags);
  }
  case ValueKind::Error: {
    const auto &error = value.as_error();
    return kObjectOverhead + string_size(error.message) +
           string_size(truncate_stack(error.stack, max_stack_frames));
  }
  case ValueKind::Unknown:
    return kOpaqueSize;
  }
  return 0;
}

MemorySizeCalculator::MemorySizeCalculator(MemoryConfig config, std::string context)
    : config_(std::move(config)), context_(std::move(context)) {}

std::uint64_t MemorySizeCalculator::calculate_size(const Value &value) {
  visited_.clear();
  retained_.clear();
  failed_reads_ = 0;
  nodes_visited_ = 0;
  started_ = std::chrono::steady_clock::now();
  return visit(value, 0);
}

void MemorySizeCalculator::fail(const MemoryViolationKind kind, const Severity severity,
                                const std::uint64_t actual, const std::uint64_t allowed,
                                const Value &value) const {
  throw MemoryProtectionError(make_memory_violation(
      kind, severity, actual, allowed, context_, std::string(value_kind_name(value.kind()))));
}

void MemorySizeCalculator::check_deadline(const Value &value) {
  const auto elapsed = std::chrono::steady_clock::now() - started_;
  if (elapsed > config_.max_calculation_time) {
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    fail(MemoryViolationKind::TimeoutExceeded, Severity::Critical,
         static_cast<std::uint64_t>(elapsed_ms),
         static_cast<std::uint64_t>(config_.max_calculation_time.count()), value);
  }
}

std::uint64_t MemorySizeCalculator::visit(const Value &value, const std::uint32_t depth) {
  ++nodes_visited_;
  if (!value.is_composite()) {
    if (nodes_visited_ % kScalarDeadlineStride == 0) {
      check_deadline(value);
    }
    return leaf_size(value, config_.max_stack_frames);
  }

  if (visited_.contains(value.identity())) {
    return 0;
  }

  check_deadline(value);
  if (depth > config_.max_nesting_depth) {
    fail(MemoryViolationKind::NestingExceeded, Severity::Medium, depth,
         config_.max_nesting_depth, value);
  }

  if (value.kind() == ValueKind::Array) {
    const ArrayNode &array = *value.as_array();
    if (array.size() > config_.max_array_length) {
      fail(MemoryViolationKind::SizeExceeded, Severity::High, array.size(),
           config_.max_array_length, value);
    }
    visited_.insert(value.identity());
    return visit_array(array, depth);
  }

  const ObjectNode &object = *value.as_object();
  if (object.size() > config_.max_property_count) {
    fail(MemoryViolationKind::PropertyCountExceeded, Severity::High, object.size(),
         config_.max_property_count, value);
  }
  visited_.insert(value.identity());
  return visit_object(object, depth);
}

std::uint64_t MemorySizeCalculator::visit_array(const ArrayNode &array,
                                                const std::uint32_t depth) {
  std::uint64_t total = kArrayOverhead;
  for (const auto &item : array.items()) {
    total += visit(item, depth + 1);
  }
  return total;
}

std::uint64_t MemorySizeCalculator::visit_object(const ObjectNode &object,
                                                 const std::uint32_t depth) {
  std::uint64_t total = kObjectOverhead;
  for (const auto &property : object.properties()) {
    Value child;
    try {
      child = ObjectNode::read(property);
    } catch (const std::exception &) {
      ++failed_reads_;
      continue;
    } catch (...) {
      // Accessors may throw anything; an unreadable property is charged zero.
      ++failed_reads_;
      continue;
    }
    if (property.getter && child.is_composite()) {
      // Keeps accessor results alive so their addresses stay unique in visited_.
      retained_.push_back(child);
    }
    total += visit(child, depth + 1);
  }
  return total;
}

std::uint64_t calculate_size(const Value &value, const MemoryConfig &config) {
  MemorySizeCalculator calculator(config);
  return calculator.calculate_size(value);
}

} // namespace wardline::memory
