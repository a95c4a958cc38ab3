#pragma once

#include "wardline/observability/observer.hpp"

#include <memory>

namespace wardline::observability {

/// Process-wide sink for engine diagnostics. Nothing is recorded until an
/// observer is installed.
void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_security_violation(const std::string &component, const std::string &category,
                               common::Severity severity, const std::string &tag);
void record_memory_violation(const std::string &id, const std::string &kind,
                             common::Severity severity, std::uint64_t actual_size,
                             std::uint64_t allowed_size, const std::string &context);
void record_security_alert(const std::string &id, const std::string &source,
                           common::Severity severity, std::size_t violation_count);
void record_error(const std::string &component, const std::string &message);

void record_risk_score(std::uint32_t score);
void record_object_size(std::uint64_t bytes, const std::string &context);
void record_scan_latency(std::chrono::microseconds latency);

} // namespace wardline::observability
