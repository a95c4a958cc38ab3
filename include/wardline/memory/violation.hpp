#pragma once

#include "wardline/common/levels.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace wardline::memory {

using common::Severity;

enum class MemoryViolationKind {
  SizeExceeded,
  PropertyCountExceeded,
  NestingExceeded,
  TimeoutExceeded,
};

[[nodiscard]] std::string_view memory_violation_kind_name(MemoryViolationKind kind);

struct MemoryViolation {
  std::string id;
  std::string timestamp;
  MemoryViolationKind kind = MemoryViolationKind::SizeExceeded;
  Severity severity = Severity::High;
  std::uint64_t actual_size = 0;
  std::uint64_t allowed_size = 0;
  std::string context;
  std::string object_type;
  std::string suggestion;
  std::string security_impact;
};

/// Builds a violation with a fresh id and timestamp. Suggestion and security
/// impact text are derived from the kind.
[[nodiscard]] MemoryViolation make_memory_violation(MemoryViolationKind kind, Severity severity,
                                                    std::uint64_t actual_size,
                                                    std::uint64_t allowed_size,
                                                    std::string context,
                                                    std::string object_type);

class MemoryProtectionError : public std::runtime_error {
public:
  explicit MemoryProtectionError(MemoryViolation violation);

  [[nodiscard]] const MemoryViolation &violation() const noexcept { return violation_; }

private:
  MemoryViolation violation_;
};

} // namespace wardline::memory
