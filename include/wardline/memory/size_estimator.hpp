#pragma once

#include "wardline/memory/config.hpp"
#include "wardline/memory/value.hpp"
#include "wardline/memory/violation.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace wardline::memory {

inline constexpr std::uint64_t kObjectOverhead = 64;
inline constexpr std::uint64_t kArrayOverhead = 64;
inline constexpr std::uint64_t kNumberSize = 8;
inline constexpr std::uint64_t kBooleanSize = 4;
inline constexpr std::uint64_t kStringUnitSize = 2;
inline constexpr std::uint64_t kOpaqueSize = 16;

/// Approximate byte footprint of a Value graph.
///
/// Every composite node is charged once; revisited nodes (shared or cyclic
/// references) add nothing. Before descending into a composite the calculator
/// checks, in order: elapsed time, nesting depth, array length and property
/// count, throwing MemoryProtectionError for the first guard that trips.
///
/// Accessor properties that throw are charged zero and counted in
/// failed_reads(). A calculator instance is reusable; each calculate_size call
/// starts with a fresh visited set and deadline.
class MemorySizeCalculator {
public:
  explicit MemorySizeCalculator(MemoryConfig config = {}, std::string context = "object");

  [[nodiscard]] std::uint64_t calculate_size(const Value &value);

  [[nodiscard]] std::size_t failed_reads() const { return failed_reads_; }
  [[nodiscard]] std::size_t nodes_visited() const { return nodes_visited_; }

private:
  std::uint64_t visit(const Value &value, std::uint32_t depth);
  std::uint64_t visit_array(const ArrayNode &array, std::uint32_t depth);
  std::uint64_t visit_object(const ObjectNode &object, std::uint32_t depth);
  void check_deadline(const Value &value);
  [[noreturn]] void fail(MemoryViolationKind kind, Severity severity, std::uint64_t actual,
                         std::uint64_t allowed, const Value &value) const;

  MemoryConfig config_;
  std::string context_;
  std::unordered_set<const void *> visited_;
  std::vector<Value> retained_;
  std::chrono::steady_clock::time_point started_;
  std::size_t failed_reads_ = 0;
  std::size_t nodes_visited_ = 0;
};

[[nodiscard]] std::uint64_t calculate_size(const Value &value, const MemoryConfig &config = {});

/// Size of a scalar or special value; composite values return their overhead.
[[nodiscard]] std::uint64_t leaf_size(const Value &value, std::uint32_t max_stack_frames);

/// First `max_frames` lines of a stack trace.
[[nodiscard]] std::string truncate_stack(const std::string &stack, std::uint32_t max_frames);

[[nodiscard]] std::uint64_t string_size(const std::string &text);

} // namespace wardline::memory
