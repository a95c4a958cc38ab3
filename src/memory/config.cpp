#include "wardline/memory/config.hpp"

#include "wardline/common/fs.hpp"

namespace wardline::memory {

MemoryConfig memory_preset(const MemoryPreset preset) {
  MemoryConfig config;
  switch (preset) {
  case MemoryPreset::Development:
    config.protection_level = ProtectionLevel::Strict;
    config.monitoring_sample_rate = 1.0;
    break;
  case MemoryPreset::Production:
    config.protection_level = ProtectionLevel::Standard;
    config.monitoring_sample_rate = 0.1;
    break;
  case MemoryPreset::Testing:
    config.protection_level = ProtectionLevel::Permissive;
    config.max_calculation_time = std::chrono::milliseconds(1000);
    config.log_violations = false;
    break;
  case MemoryPreset::Audit:
    config.protection_level = ProtectionLevel::Strict;
    config.strict_mode = true;
    config.max_object_size = 5 * 1024;
    config.max_property_count = 25;
    break;
  }
  return config;
}

std::optional<MemoryPreset> parse_memory_preset(const std::string &name) {
  const std::string normalized = common::to_lower(common::trim(name));
  if (normalized == "development") {
    return MemoryPreset::Development;
  }
  if (normalized == "production") {
    return MemoryPreset::Production;
  }
  if (normalized == "testing") {
    return MemoryPreset::Testing;
  }
  if (normalized == "audit") {
    return MemoryPreset::Audit;
  }
  return std::nullopt;
}

std::string_view memory_preset_name(const MemoryPreset preset) {
  switch (preset) {
  case MemoryPreset::Development:
    return "development";
  case MemoryPreset::Production:
    return "production";
  case MemoryPreset::Testing:
    return "testing";
  case MemoryPreset::Audit:
    return "audit";
  }
  return "production";
}

} // namespace wardline::memory
