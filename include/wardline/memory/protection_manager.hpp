#pragma once

#include "wardline/memory/config.hpp"
#include "wardline/memory/size_estimator.hpp"
#include "wardline/memory/value.hpp"
#include "wardline/memory/violation.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wardline::memory {

enum class UsageLevel { Safe, Warning, Critical, Exceeded };
enum class PerformanceImpact { None, Low, High };

[[nodiscard]] std::string_view usage_level_name(UsageLevel level);
[[nodiscard]] std::string_view performance_impact_name(PerformanceImpact impact);

inline constexpr std::string_view kTruncationSuffix = "...[TRUNCATED]";

struct MemoryAnalysis {
  std::uint64_t estimated_bytes = 0;
  UsageLevel usage_level = UsageLevel::Safe;
  std::vector<MemoryViolation> violations;
  std::uint32_t security_score = 100;
  std::vector<std::string> recommendations;
  PerformanceImpact performance_impact = PerformanceImpact::None;
  bool requires_action = false;
};

struct ProtectedOperationResult {
  bool success = false;
  std::optional<Value> result;
  std::optional<std::string> error;
  MemoryAnalysis memory_analysis;
  std::vector<std::string> warnings;
  std::chrono::duration<double, std::milli> execution_time{0};
  std::int64_t memory_delta_bytes = 0;
  bool protection_applied = false;
};

struct ProtectionStats {
  std::uint64_t total_violations = 0;
  std::map<Severity, std::uint64_t> violations_by_severity;
  double average_object_size = 0.0;
  ProtectionLevel protection_level = ProtectionLevel::Standard;
  std::uint64_t objects_validated = 0;
};

/// Enforces MemoryConfig ceilings on values and operation results.
///
/// Guard trips and oversized values are reported as data in MemoryAnalysis and
/// accumulated in the statistics. With strict_mode set, validate_object_size
/// throws MemoryProtectionError instead. Statistics are guarded by a mutex.
class MemoryProtectionManager {
public:
  explicit MemoryProtectionManager(MemoryConfig config = {});

  [[nodiscard]] MemoryAnalysis validate_object_size(const Value &value,
                                                    const std::string &context = "object");
  [[nodiscard]] MemoryAnalysis validate_object_size(const Value &value,
                                                    const MemoryConfig &config,
                                                    const std::string &context = "object");

  /// Runs `operation` and validates its result. Never rethrows: a failing
  /// operation yields success=false with a length-bounded error message.
  [[nodiscard]] ProtectedOperationResult
  protect_operation(const std::function<Value()> &operation,
                    const std::string &context = "operation");

  [[nodiscard]] ProtectionStats get_protection_stats() const;
  [[nodiscard]] std::vector<MemoryViolation> recent_violations() const;
  void reset_stats();

  [[nodiscard]] Value truncate_for_memory(const Value &value) const;
  [[nodiscard]] bool is_memory_safe(const Value &value) const;

  [[nodiscard]] const MemoryConfig &config() const { return config_; }

private:
  void record(const MemoryAnalysis &analysis, const MemoryConfig &config,
              const std::string &context);

  MemoryConfig config_;
  mutable std::mutex mutex_;
  std::uint64_t total_violations_ = 0;
  std::map<Severity, std::uint64_t> by_severity_;
  std::uint64_t objects_validated_ = 0;
  std::uint64_t measured_objects_ = 0;
  long double measured_bytes_ = 0;
  std::deque<MemoryViolation> recent_;
  std::uint64_t sample_counter_ = 0;
};

/// Analyses `value` against `config` without touching any statistics.
[[nodiscard]] MemoryAnalysis analyze_memory(const Value &value, const MemoryConfig &config,
                                            const std::string &context = "object");

[[nodiscard]] bool is_memory_safe(const Value &value, const MemoryConfig &config);
/// The result is memory safe for every positive max_object_size. A zero
/// ceiling admits nothing, so the result is undefined and still not safe;
/// validate_config rejects that setting.
[[nodiscard]] Value truncate_for_memory(const Value &value, const MemoryConfig &config);

/// Cuts `text` to at most `max_bytes` bytes at a UTF-8 boundary, appending
/// `marker` when a cut happens. The marker counts towards the limit when it fits.
[[nodiscard]] std::string truncate_text(std::string_view text, std::size_t max_bytes,
                                        std::string_view marker = kTruncationSuffix);

} // namespace wardline::memory
