#include "wardline/observability/global.hpp"

#include <mutex>

namespace wardline::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_security_violation(const std::string &component, const std::string &category,
                               const common::Severity severity, const std::string &tag) {
  record_event(SecurityViolationEvent{
      .component = component, .category = category, .severity = severity, .tag = tag});
}

void record_memory_violation(const std::string &id, const std::string &kind,
                             const common::Severity severity, const std::uint64_t actual_size,
                             const std::uint64_t allowed_size, const std::string &context) {
  record_event(MemoryViolationEvent{.id = id,
                                    .kind = kind,
                                    .severity = severity,
                                    .actual_size = actual_size,
                                    .allowed_size = allowed_size,
                                    .context = context});
}

void record_security_alert(const std::string &id, const std::string &source,
                           const common::Severity severity, const std::size_t violation_count) {
  record_event(SecurityAlertEvent{
      .id = id, .source = source, .severity = severity, .violation_count = violation_count});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_risk_score(const std::uint32_t score) { record_metric(RiskScoreMetric{.score = score}); }

void record_object_size(const std::uint64_t bytes, const std::string &context) {
  record_metric(ObjectSizeMetric{.bytes = bytes, .context = context});
}

void record_scan_latency(const std::chrono::microseconds latency) {
  record_metric(ScanLatencyMetric{.latency = latency});
}

} // namespace wardline::observability
