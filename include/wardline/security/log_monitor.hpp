#pragma once

#include "wardline/security/sanitize_config.hpp"
#include "wardline/security/violation.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wardline::security {

inline constexpr std::size_t kMaxSourceIdBytes = 128;
inline constexpr std::size_t kMaxAlertViolations = 64;

struct SecurityAlert {
  std::string id;
  Severity severity = Severity::Low;
  std::string source;
  std::vector<SecurityViolation> violations;
  std::string timestamp;
};

using AlertCallback = std::function<void(const SecurityAlert &)>;

struct MonitorConfig {
  std::size_t alert_threshold = 5;
  std::chrono::milliseconds time_window = std::chrono::seconds(60);
  std::size_t max_sources = 1024;
  SanitizationConfig sanitization;
  AlertCallback on_alert;
};

struct MonitorStats {
  std::uint64_t messages_processed = 0;
  std::uint64_t messages_with_violations = 0;
  std::uint64_t total_violations = 0;
  std::uint64_t alerts_raised = 0;
  std::uint64_t evicted_sources = 0;
  std::size_t tracked_sources = 0;
};

/// Counts violations per source inside a sliding window and raises an alert
/// when a source reaches the threshold. Expired windows are dropped lazily on
/// the next message from that source. Safe to share between threads; the
/// alert callback runs without the lock held.
class LogSecurityMonitor {
public:
  explicit LogSecurityMonitor(MonitorConfig config = {});

  RiskAnalysis monitor_message(std::string_view text, std::string_view source_id);
  RiskAnalysis monitor_message_at(std::string_view text, std::string_view source_id,
                                  std::chrono::steady_clock::time_point now);

  [[nodiscard]] MonitorStats get_stats() const;
  void reset();

  void set_alert_callback(AlertCallback callback);

  /// Display form of a source id: sanitized, and replaced by a SHA-256
  /// fingerprint when longer than kMaxSourceIdBytes.
  [[nodiscard]] static std::string normalize_source(std::string_view source_id);

private:
  struct SourceWindow {
    std::chrono::steady_clock::time_point window_start;
    std::size_t violation_count = 0;
    Severity max_severity = Severity::Low;
    std::vector<SecurityViolation> violations;
  };

  void evict_oldest_locked();

  MonitorConfig config_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SourceWindow> windows_;
  MonitorStats stats_;
};

} // namespace wardline::security
