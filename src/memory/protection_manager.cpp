#include "wardline/memory/protection_manager.hpp"

#include "wardline/common/utf8.hpp"
#include "wardline/observability/global.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <new>
#include <unordered_set>
#include <unistd.h>

namespace wardline::memory {

namespace {

constexpr std::size_t kRecentViolationLimit = 100;
constexpr std::string_view kCircularMarker = "[Circular]";
constexpr std::string_view kDepthMarker = "[Truncated]";

std::uint32_t score_penalty(const Severity severity) {
  switch (severity) {
  case Severity::Critical:
    return 30;
  case Severity::High:
    return 20;
  case Severity::Medium:
    return 10;
  case Severity::Low:
    return 5;
  }
  return 0;
}

UsageLevel usage_for(const std::uint64_t bytes, const std::uint64_t max_size) {
  if (max_size == 0 || bytes >= max_size) {
    return UsageLevel::Exceeded;
  }
  const std::uint64_t percent = bytes * 100 / max_size;
  if (percent >= 80) {
    return UsageLevel::Critical;
  }
  if (percent >= 60) {
    return UsageLevel::Warning;
  }
  return UsageLevel::Safe;
}

std::vector<std::string> recommendations_for(const UsageLevel usage,
                                             const std::vector<MemoryViolation> &violations) {
  std::vector<std::string> out;
  switch (usage) {
  case UsageLevel::Exceeded:
    out.emplace_back(
        "CRITICAL: Memory usage exceeds safe limits. Implement immediate reduction measures.");
    break;
  case UsageLevel::Critical:
    out.emplace_back("WARNING: Memory usage is approaching limits. Consider optimization.");
    break;
  case UsageLevel::Warning:
    out.emplace_back("NOTICE: Memory usage is elevated. Monitor for continued growth.");
    break;
  case UsageLevel::Safe:
    break;
  }

  const auto has_kind = [&violations](const MemoryViolationKind kind) {
    return std::any_of(violations.begin(), violations.end(),
                       [kind](const MemoryViolation &v) { return v.kind == kind; });
  };
  if (has_kind(MemoryViolationKind::SizeExceeded)) {
    out.emplace_back(
        "Reduce object complexity by splitting large objects into smaller components.");
  }
  if (has_kind(MemoryViolationKind::PropertyCountExceeded)) {
    out.emplace_back("Limit object properties and move dynamic keys into bounded collections.");
  }
  if (has_kind(MemoryViolationKind::NestingExceeded)) {
    out.emplace_back("Flatten deeply nested structures before logging or storing them.");
  }
  if (has_kind(MemoryViolationKind::TimeoutExceeded)) {
    out.emplace_back("Reject inputs that are too expensive to analyse; this pattern matches "
                     "resource exhaustion attempts.");
  }
  return out;
}

PerformanceImpact impact_for(const std::uint64_t bytes, const std::uint64_t max_size,
                             const std::vector<MemoryViolation> &violations) {
  const auto serious = std::count_if(violations.begin(), violations.end(), [](const auto &v) {
    return v.severity >= Severity::High;
  });
  if (bytes >= max_size || serious > 0) {
    return PerformanceImpact::High;
  }
  if (bytes * 2 > max_size || !violations.empty()) {
    return PerformanceImpact::Low;
  }
  return PerformanceImpact::None;
}

std::int64_t resident_bytes() {
  std::ifstream statm("/proc/self/statm");
  std::int64_t total_pages = 0;
  std::int64_t resident_pages = 0;
  if (!(statm >> total_pages >> resident_pages)) {
    return 0;
  }
  const long page_size = sysconf(_SC_PAGESIZE);
  return resident_pages * (page_size > 0 ? page_size : 4096);
}

std::size_t take_utf16_units(std::string_view text, const std::size_t units) {
  std::size_t index = 0;
  std::size_t used = 0;
  while (index < text.size()) {
    std::size_t next = index;
    std::uint32_t cp = 0;
    const std::size_t cost = (common::decode_utf8(text, next, cp) && cp >= 0x10000U) ? 2 : 1;
    if (used + cost > units) {
      break;
    }
    used += cost;
    index = next;
  }
  return index;
}

struct Truncated {
  Value value;
  std::uint64_t size = 0;
  bool reduced = false;
};

// Rebuilds an oversized graph as a fresh tree whose size stays within a byte
// budget and within the estimator's structural guards.
class Truncator {
public:
  explicit Truncator(const MemoryConfig &config) : config_(config) {}

  Truncated run(const Value &value, const std::uint64_t budget, const std::uint32_t depth) {
    if (!value.is_composite()) {
      return leaf(value, budget);
    }
    if (ancestors_.contains(value.identity())) {
      return marker(kCircularMarker, budget);
    }
    if (depth > config_.max_nesting_depth) {
      return marker(kDepthMarker, budget);
    }
    if (value.kind() == ValueKind::Array) {
      return array(value, budget, depth);
    }
    return object(value, budget, depth);
  }

private:
  Truncated leaf(const Value &value, const std::uint64_t budget) const {
    const std::uint64_t size = leaf_size(value, config_.max_stack_frames);
    if (size <= budget) {
      return Truncated{.value = value, .size = size, .reduced = false};
    }
    if (value.kind() == ValueKind::String) {
      return text(value.as_string(), budget);
    }
    if (value.kind() == ValueKind::Error) {
      return error(value.as_error(), budget);
    }
    return Truncated{.value = Value(), .size = 0, .reduced = true};
  }

  static Truncated text(const std::string &input, const std::uint64_t budget) {
    const std::uint64_t units = budget / kStringUnitSize;
    const std::uint64_t marker_units = kTruncationSuffix.size();
    if (units <= marker_units) {
      return Truncated{.value = Value(), .size = 0, .reduced = true};
    }
    const std::size_t keep = take_utf16_units(input, units - marker_units);
    std::string out = input.substr(0, keep);
    out.append(kTruncationSuffix);
    const std::uint64_t size = string_size(out);
    return Truncated{.value = Value::string(std::move(out)), .size = size, .reduced = true};
  }

  Truncated error(const ErrorValue &source, const std::uint64_t budget) const {
    if (budget < kObjectOverhead) {
      return Truncated{.value = Value(), .size = 0, .reduced = true};
    }
    std::string stack = truncate_stack(source.stack, config_.max_stack_frames);
    std::uint64_t remaining = budget - kObjectOverhead;
    if (string_size(stack) > remaining / 2) {
      stack.clear();
    }
    remaining -= string_size(stack);
    std::string message = source.message;
    if (string_size(message) > remaining) {
      const Truncated cut = text(message, remaining);
      message = cut.value.is_string() ? cut.value.as_string() : std::string();
    }
    Value out = Value::error(std::move(message), std::move(stack), source.name);
    const std::uint64_t size = leaf_size(out, config_.max_stack_frames);
    return Truncated{.value = std::move(out), .size = size, .reduced = true};
  }

  static Truncated marker(std::string_view text, const std::uint64_t budget) {
    const std::uint64_t size = kStringUnitSize * text.size();
    if (size > budget) {
      return Truncated{.value = Value(), .size = 0, .reduced = true};
    }
    return Truncated{.value = Value::string(std::string(text)), .size = size, .reduced = true};
  }

  Truncated array(const Value &value, const std::uint64_t budget, const std::uint32_t depth) {
    if (budget < kArrayOverhead) {
      return Truncated{.value = Value(), .size = 0, .reduced = true};
    }
    const ArrayNode &source = *value.as_array();
    auto out = Value::array();
    std::uint64_t used = kArrayOverhead;
    bool reduced = source.size() > config_.max_array_length;
    const std::size_t limit =
        static_cast<std::size_t>(std::min<std::uint64_t>(source.size(), config_.max_array_length));

    ancestors_.insert(value.identity());
    for (std::size_t i = 0; i < limit; ++i) {
      if (used >= budget) {
        reduced = true;
        break;
      }
      Truncated child = run(source.at(i), budget - used, depth + 1);
      out.as_array()->push_back(std::move(child.value));
      used += child.size;
      if (child.reduced) {
        reduced = true;
        break;
      }
    }
    ancestors_.erase(value.identity());
    return Truncated{.value = std::move(out), .size = used, .reduced = reduced};
  }

  Truncated object(const Value &value, const std::uint64_t budget, const std::uint32_t depth) {
    if (budget < kObjectOverhead) {
      return Truncated{.value = Value(), .size = 0, .reduced = true};
    }
    const ObjectNode &source = *value.as_object();
    auto out = Value::object();
    std::uint64_t used = kObjectOverhead;
    bool reduced = false;
    std::uint64_t kept = 0;

    ancestors_.insert(value.identity());
    for (const auto &property : source.properties()) {
      if (kept >= config_.max_property_count || used >= budget) {
        reduced = true;
        break;
      }
      Value child_value;
      try {
        child_value = ObjectNode::read(property);
      } catch (const std::exception &) {
        reduced = true;
        continue;
      } catch (...) {
        reduced = true;
        continue;
      }
      Truncated child = run(child_value, budget - used, depth + 1);
      out.as_object()->set(property.key, std::move(child.value));
      used += child.size;
      ++kept;
      if (child.reduced) {
        reduced = true;
        break;
      }
    }
    ancestors_.erase(value.identity());
    return Truncated{.value = std::move(out), .size = used, .reduced = reduced};
  }

  const MemoryConfig &config_;
  std::unordered_set<const void *> ancestors_;
};

} // namespace

std::string_view usage_level_name(const UsageLevel level) {
  switch (level) {
  case UsageLevel::Safe:
    return "safe";
  case UsageLevel::Warning:
    return "warning";
  case UsageLevel::Critical:
    return "critical";
  case UsageLevel::Exceeded:
    return "exceeded";
  }
  return "safe";
}

std::string_view performance_impact_name(const PerformanceImpact impact) {
  switch (impact) {
  case PerformanceImpact::None:
    return "none";
  case PerformanceImpact::Low:
    return "low";
  case PerformanceImpact::High:
    return "high";
  }
  return "none";
}

MemoryAnalysis analyze_memory(const Value &value, const MemoryConfig &config,
                              const std::string &context) {
  MemoryAnalysis analysis;
  bool guard_tripped = false;
  try {
    MemorySizeCalculator calculator(config, context);
    analysis.estimated_bytes = calculator.calculate_size(value);
  } catch (const MemoryProtectionError &ex) {
    analysis.violations.push_back(ex.violation());
    guard_tripped = true;
  } catch (const std::bad_alloc &) {
    analysis.violations.push_back(make_memory_violation(
        MemoryViolationKind::SizeExceeded, Severity::Critical, 0, config.max_object_size,
        context, std::string(value_kind_name(value.kind()))));
    guard_tripped = true;
  }

  if (!guard_tripped && analysis.estimated_bytes >= config.max_object_size) {
    const Severity severity = analysis.estimated_bytes > 2 * config.max_object_size
                                  ? Severity::Critical
                                  : Severity::High;
    analysis.violations.push_back(make_memory_violation(
        MemoryViolationKind::SizeExceeded, severity, analysis.estimated_bytes,
        config.max_object_size, context, std::string(value_kind_name(value.kind()))));
  }

  analysis.usage_level = guard_tripped ? UsageLevel::Exceeded
                                       : usage_for(analysis.estimated_bytes, config.max_object_size);

  std::uint32_t score = 100;
  for (const auto &violation : analysis.violations) {
    score -= std::min(score, score_penalty(violation.severity));
  }
  if (analysis.usage_level == UsageLevel::Critical) {
    score -= std::min<std::uint32_t>(score, 15);
  } else if (analysis.usage_level == UsageLevel::Warning) {
    score -= std::min<std::uint32_t>(score, 10);
  }
  analysis.security_score = score;

  analysis.recommendations = recommendations_for(analysis.usage_level, analysis.violations);
  analysis.performance_impact =
      guard_tripped ? PerformanceImpact::High
                    : impact_for(analysis.estimated_bytes, config.max_object_size,
                                 analysis.violations);
  analysis.requires_action =
      analysis.usage_level >= UsageLevel::Critical ||
      std::any_of(analysis.violations.begin(), analysis.violations.end(),
                  [](const MemoryViolation &v) { return v.severity >= Severity::High; });
  return analysis;
}

bool is_memory_safe(const Value &value, const MemoryConfig &config) {
  try {
    MemorySizeCalculator calculator(config);
    return calculator.calculate_size(value) < config.max_object_size;
  } catch (const MemoryProtectionError &) {
    return false;
  }
}

Value truncate_for_memory(const Value &value, const MemoryConfig &config) {
  if (is_memory_safe(value, config)) {
    return value;
  }
  if (config.max_object_size == 0) {
    return Value();
  }
  Truncator truncator(config);
  return truncator.run(value, config.max_object_size - 1, 0).value;
}

std::string truncate_text(std::string_view text, const std::size_t max_bytes,
                          std::string_view marker) {
  if (text.size() <= max_bytes) {
    return std::string(text);
  }
  if (marker.size() >= max_bytes) {
    return std::string(text.substr(0, common::utf8_prefix_length(text, max_bytes)));
  }
  const std::size_t keep = common::utf8_prefix_length(text, max_bytes - marker.size());
  std::string out(text.substr(0, keep));
  out.append(marker);
  return out;
}

MemoryProtectionManager::MemoryProtectionManager(MemoryConfig config)
    : config_(std::move(config)) {}

MemoryAnalysis MemoryProtectionManager::validate_object_size(const Value &value,
                                                             const std::string &context) {
  return validate_object_size(value, config_, context);
}

MemoryAnalysis MemoryProtectionManager::validate_object_size(const Value &value,
                                                             const MemoryConfig &config,
                                                             const std::string &context) {
  MemoryAnalysis analysis = analyze_memory(value, config, context);
  record(analysis, config, context);

  if (config.strict_mode && analysis.usage_level == UsageLevel::Exceeded &&
      !analysis.violations.empty()) {
    throw MemoryProtectionError(analysis.violations.front());
  }
  return analysis;
}

void MemoryProtectionManager::record(const MemoryAnalysis &analysis, const MemoryConfig &config,
                                     const std::string &context) {
  bool emit_sample = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++objects_validated_;
    if (analysis.violations.empty() || analysis.estimated_bytes > 0) {
      ++measured_objects_;
      measured_bytes_ += static_cast<long double>(analysis.estimated_bytes);
    }
    for (const auto &violation : analysis.violations) {
      ++total_violations_;
      ++by_severity_[violation.severity];
      recent_.push_back(violation);
      if (recent_.size() > kRecentViolationLimit) {
        recent_.pop_front();
      }
    }

    const double rate = config.monitoring_sample_rate;
    if (rate >= 1.0) {
      emit_sample = true;
    } else if (rate > 0.0) {
      const auto stride = static_cast<std::uint64_t>(std::llround(1.0 / rate));
      emit_sample = stride == 0 || sample_counter_ % stride == 0;
      ++sample_counter_;
    }
  }

  if (config.log_violations) {
    for (const auto &violation : analysis.violations) {
      observability::record_memory_violation(
          violation.id, std::string(memory_violation_kind_name(violation.kind)),
          violation.severity, violation.actual_size, violation.allowed_size, violation.context);
    }
  }
  if (emit_sample) {
    observability::record_object_size(analysis.estimated_bytes, context);
  }
}

ProtectedOperationResult
MemoryProtectionManager::protect_operation(const std::function<Value()> &operation,
                                           const std::string &context) {
  ProtectedOperationResult out;
  const std::int64_t rss_before = resident_bytes();
  const auto started = std::chrono::steady_clock::now();

  try {
    out.result = operation();
    out.success = true;
  } catch (const MemoryProtectionError &ex) {
    out.error = truncate_text(ex.what(), config_.max_message_length);
    out.memory_analysis.violations.push_back(ex.violation());
    out.protection_applied = true;
  } catch (const std::exception &ex) {
    out.error = truncate_text(ex.what(), config_.max_message_length);
  } catch (...) {
    out.error = "operation failed with a non-standard exception";
  }

  out.execution_time = std::chrono::steady_clock::now() - started;
  out.memory_delta_bytes = resident_bytes() - rss_before;

  if (out.success) {
    MemoryConfig advisory = config_;
    // Results are checked after the fact, so strict mode must not throw here.
    advisory.strict_mode = false;
    out.memory_analysis = validate_object_size(*out.result, advisory, context);
    if (!out.memory_analysis.violations.empty()) {
      out.protection_applied = true;
      out.warnings.push_back("Operation result exceeded memory limits in " + context + ": " +
                             std::to_string(out.memory_analysis.estimated_bytes) + " bytes");
    }
  } else {
    observability::record_error("memory", context + ": " + out.error.value_or("unknown error"));
  }

  if (out.execution_time > config_.max_calculation_time * 10) {
    out.warnings.push_back("Operation " + context + " took " +
                           std::to_string(static_cast<long long>(out.execution_time.count())) +
                           " ms");
  }
  return out;
}

ProtectionStats MemoryProtectionManager::get_protection_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  ProtectionStats stats;
  stats.total_violations = total_violations_;
  for (const Severity severity :
       {Severity::Low, Severity::Medium, Severity::High, Severity::Critical}) {
    const auto it = by_severity_.find(severity);
    stats.violations_by_severity[severity] = it == by_severity_.end() ? 0 : it->second;
  }
  stats.average_object_size =
      measured_objects_ == 0
          ? 0.0
          : static_cast<double>(measured_bytes_ / static_cast<long double>(measured_objects_));
  stats.protection_level = config_.protection_level;
  stats.objects_validated = objects_validated_;
  return stats;
}

std::vector<MemoryViolation> MemoryProtectionManager::recent_violations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {recent_.begin(), recent_.end()};
}

void MemoryProtectionManager::reset_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  total_violations_ = 0;
  by_severity_.clear();
  objects_validated_ = 0;
  measured_objects_ = 0;
  measured_bytes_ = 0;
  recent_.clear();
  sample_counter_ = 0;
}

Value MemoryProtectionManager::truncate_for_memory(const Value &value) const {
  return memory::truncate_for_memory(value, config_);
}

bool MemoryProtectionManager::is_memory_safe(const Value &value) const {
  return memory::is_memory_safe(value, config_);
}

} // namespace wardline::memory
