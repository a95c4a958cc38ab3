#include "wardline/observability/log_observer.hpp"

#include "wardline/security/threat_detector.hpp"

#include <iostream>
#include <type_traits>

namespace wardline::observability {

namespace {

std::string_view level_for(const common::Severity severity) {
  switch (severity) {
  case common::Severity::Critical:
  case common::Severity::High:
    return "ERROR";
  case common::Severity::Medium:
    return "WARN";
  case common::Severity::Low:
    return "INFO";
  }
  return "INFO";
}

std::string severity_text(const common::Severity severity) {
  return std::string(common::severity_name(severity));
}

} // namespace

LogObserver::LogObserver() : LogObserver(std::cerr) {}

LogObserver::LogObserver(std::ostream &out, const bool include_metrics)
    : out_(out), include_metrics_(include_metrics) {}

void LogObserver::log_line(std::string_view level, const std::string &message) {
  const std::string safe = security::sanitize(message, security::log_sanitization_config());
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << safe << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, SecurityViolationEvent>) {
          log_line(level_for(evt.severity), "security.violation component=" + evt.component +
                                                " category=" + evt.category +
                                                " severity=" + severity_text(evt.severity));
        } else if constexpr (std::is_same_v<T, MemoryViolationEvent>) {
          log_line(level_for(evt.severity),
                   "memory.violation id=" + evt.id + " kind=" + evt.kind +
                       " severity=" + severity_text(evt.severity) +
                       " actual=" + std::to_string(evt.actual_size) +
                       " allowed=" + std::to_string(evt.allowed_size) + " context=" + evt.context);
        } else if constexpr (std::is_same_v<T, SecurityAlertEvent>) {
          log_line("ALERT", "security.alert id=" + evt.id + " source=" + evt.source +
                                " severity=" + severity_text(evt.severity) +
                                " violations=" + std::to_string(evt.violation_count));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  if (!include_metrics_) {
    return;
  }
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RiskScoreMetric>) {
          log_line("DEBUG", "metric.risk_score=" + std::to_string(m.score));
        } else if constexpr (std::is_same_v<T, ObjectSizeMetric>) {
          log_line("DEBUG",
                   "metric.object_size_bytes=" + std::to_string(m.bytes) + " context=" + m.context);
        } else if constexpr (std::is_same_v<T, ScanLatencyMetric>) {
          log_line("DEBUG", "metric.scan_latency_us=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace wardline::observability
