#include "wardline/security/log_monitor.hpp"

#include "wardline/common/ids.hpp"
#include "wardline/observability/global.hpp"
#include "wardline/security/threat_detector.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace wardline::security {

LogSecurityMonitor::LogSecurityMonitor(MonitorConfig config) : config_(std::move(config)) {
  if (config_.alert_threshold == 0) {
    config_.alert_threshold = 1;
  }
  if (config_.max_sources == 0) {
    config_.max_sources = 1;
  }
}

std::string LogSecurityMonitor::normalize_source(const std::string_view source_id) {
  if (source_id.empty()) {
    return "unknown";
  }
  SanitizationConfig config = sanitization_preset(ProtectionLevel::Standard);
  config.max_input_length = kMaxSourceIdBytes * 4;
  std::string cleaned = sanitize(source_id, config);
  if (cleaned.size() <= kMaxSourceIdBytes) {
    return cleaned;
  }
  return "sha256:" + common::sha256_hex(std::string(source_id));
}

RiskAnalysis LogSecurityMonitor::monitor_message(const std::string_view text,
                                                 const std::string_view source_id) {
  return monitor_message_at(text, source_id, std::chrono::steady_clock::now());
}

RiskAnalysis LogSecurityMonitor::monitor_message_at(const std::string_view text,
                                                    const std::string_view source_id,
                                                    const std::chrono::steady_clock::time_point now) {
  const auto started = std::chrono::steady_clock::now();
  RiskAnalysis analysis = analyze(text, config_.sanitization);
  const std::string source = normalize_source(source_id);

  std::optional<SecurityAlert> alert;
  AlertCallback callback;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.messages_processed;
    const std::size_t count = analysis.total_violations();
    if (count > 0) {
      ++stats_.messages_with_violations;
      stats_.total_violations += count;

      auto it = windows_.find(source);
      if (it == windows_.end()) {
        if (windows_.size() >= config_.max_sources) {
          evict_oldest_locked();
        }
        it = windows_.emplace(source, SourceWindow{now, 0, Severity::Low, {}}).first;
      } else if (now - it->second.window_start > config_.time_window) {
        it->second = SourceWindow{now, 0, Severity::Low, {}};
      }

      SourceWindow &window = it->second;
      window.violation_count += count;
      for (const auto &violation : analysis.violations) {
        window.max_severity = std::max(window.max_severity, violation.severity);
        if (window.violations.size() < kMaxAlertViolations) {
          window.violations.push_back(violation);
        }
      }

      if (window.violation_count >= config_.alert_threshold) {
        alert = SecurityAlert{"ALERT_" + common::random_hex(8), window.max_severity, source,
                              std::move(window.violations), common::iso8601_now()};
        window = SourceWindow{now, 0, Severity::Low, {}};
        ++stats_.alerts_raised;
        callback = config_.on_alert;
      }
    }
    stats_.tracked_sources = windows_.size();
  }

  for (const auto &violation : analysis.violations) {
    observability::record_security_violation("monitor", std::string(category_name(violation.category)),
                                             violation.severity, violation.replacement_tag);
  }
  observability::record_scan_latency(std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - started));
  observability::record_risk_score(analysis.risk_score);

  if (alert.has_value()) {
    observability::record_security_alert(alert->id, alert->source, alert->severity,
                                         alert->violations.size());
    if (callback) {
      callback(*alert);
    }
  }
  return analysis;
}

void LogSecurityMonitor::evict_oldest_locked() {
  if (windows_.empty()) {
    return;
  }
  auto oldest = windows_.begin();
  for (auto it = windows_.begin(); it != windows_.end(); ++it) {
    if (it->second.window_start < oldest->second.window_start) {
      oldest = it;
    }
  }
  windows_.erase(oldest);
  ++stats_.evicted_sources;
}

MonitorStats LogSecurityMonitor::get_stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MonitorStats stats = stats_;
  stats.tracked_sources = windows_.size();
  return stats;
}

void LogSecurityMonitor::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  windows_.clear();
  stats_ = MonitorStats{};
}

void LogSecurityMonitor::set_alert_callback(AlertCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.on_alert = std::move(callback);
}

} // namespace wardline::security
