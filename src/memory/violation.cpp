#include "wardline/memory/violation.hpp"

#include "wardline/common/ids.hpp"

namespace wardline::memory {

namespace {

std::string suggestion_for(const MemoryViolationKind kind) {
  switch (kind) {
  case MemoryViolationKind::SizeExceeded:
    return "Reduce the payload or truncate it with truncate_for_memory before storing it";
  case MemoryViolationKind::PropertyCountExceeded:
    return "Split the object or drop unused properties";
  case MemoryViolationKind::NestingExceeded:
    return "Flatten the structure or reduce its nesting depth";
  case MemoryViolationKind::TimeoutExceeded:
    return "Reject the input; it is too expensive to analyse";
  }
  return "Review the input";
}

std::string impact_for(const MemoryViolationKind kind) {
  switch (kind) {
  case MemoryViolationKind::SizeExceeded:
    return "Oversized payloads can exhaust process memory";
  case MemoryViolationKind::PropertyCountExceeded:
    return "Property floods can exhaust memory and slow serialization";
  case MemoryViolationKind::NestingExceeded:
    return "Deep nesting can exhaust the stack during traversal";
  case MemoryViolationKind::TimeoutExceeded:
    return "Possible resource exhaustion attempt through an expensive structure";
  }
  return "Unknown";
}

std::string describe(const MemoryViolation &violation) {
  return std::string("memory protection: ") +
         std::string(memory_violation_kind_name(violation.kind)) + " in " + violation.context +
         " (" + std::to_string(violation.actual_size) + " > " +
         std::to_string(violation.allowed_size) + ")";
}

} // namespace

std::string_view memory_violation_kind_name(const MemoryViolationKind kind) {
  switch (kind) {
  case MemoryViolationKind::SizeExceeded:
    return "size_exceeded";
  case MemoryViolationKind::PropertyCountExceeded:
    return "property_count_exceeded";
  case MemoryViolationKind::NestingExceeded:
    return "nesting_exceeded";
  case MemoryViolationKind::TimeoutExceeded:
    return "timeout_exceeded";
  }
  return "size_exceeded";
}

MemoryViolation make_memory_violation(const MemoryViolationKind kind, const Severity severity,
                                      const std::uint64_t actual_size,
                                      const std::uint64_t allowed_size, std::string context,
                                      std::string object_type) {
  return MemoryViolation{.id = "MEM_" + common::random_hex(8),
                         .timestamp = common::iso8601_now(),
                         .kind = kind,
                         .severity = severity,
                         .actual_size = actual_size,
                         .allowed_size = allowed_size,
                         .context = std::move(context),
                         .object_type = std::move(object_type),
                         .suggestion = suggestion_for(kind),
                         .security_impact = impact_for(kind)};
}

MemoryProtectionError::MemoryProtectionError(MemoryViolation violation)
    : std::runtime_error(describe(violation)), violation_(std::move(violation)) {}

} // namespace wardline::memory
