#pragma once

#include "wardline/common/levels.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace wardline::memory {

using common::ProtectionLevel;

struct MemoryConfig {
  std::uint64_t max_object_size = 10 * 1024;
  std::uint64_t max_array_length = 1000;
  std::uint64_t max_property_count = 50;
  std::uint32_t max_nesting_depth = 10;
  std::chrono::milliseconds max_calculation_time{100};
  bool strict_mode = false;
  ProtectionLevel protection_level = ProtectionLevel::Standard;

  std::uint64_t max_context_size = 64 * 1024;
  std::uint64_t max_message_length = 500;
  std::uint32_t max_stack_frames = 10;
  /// Fraction of successful validations that emit a size metric.
  double monitoring_sample_rate = 1.0;
  bool log_violations = true;
};

enum class MemoryPreset { Development, Production, Testing, Audit };

[[nodiscard]] MemoryConfig memory_preset(MemoryPreset preset);
[[nodiscard]] std::optional<MemoryPreset> parse_memory_preset(const std::string &name);
[[nodiscard]] std::string_view memory_preset_name(MemoryPreset preset);

} // namespace wardline::memory
