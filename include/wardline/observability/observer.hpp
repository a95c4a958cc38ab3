#pragma once

#include "wardline/common/levels.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace wardline::observability {

struct SecurityViolationEvent {
  std::string component;
  std::string category;
  common::Severity severity = common::Severity::Low;
  std::string tag;
};

struct MemoryViolationEvent {
  std::string id;
  std::string kind;
  common::Severity severity = common::Severity::High;
  std::uint64_t actual_size = 0;
  std::uint64_t allowed_size = 0;
  std::string context;
};

struct SecurityAlertEvent {
  std::string id;
  std::string source;
  common::Severity severity = common::Severity::Low;
  std::size_t violation_count = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<SecurityViolationEvent, MemoryViolationEvent, SecurityAlertEvent, ErrorEvent>;

struct RiskScoreMetric {
  std::uint32_t score = 0;
};

struct ObjectSizeMetric {
  std::uint64_t bytes = 0;
  std::string context;
};

struct ScanLatencyMetric {
  std::chrono::microseconds latency{0};
};

using ObserverMetric = std::variant<RiskScoreMetric, ObjectSizeMetric, ScanLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace wardline::observability
