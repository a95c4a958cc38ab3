#pragma once

#include "wardline/observability/observer.hpp"

#include <iosfwd>
#include <mutex>

namespace wardline::observability {

/// Writes one "[LEVEL] message" line per event. Every line passes through the
/// text sanitizer first, so attacker-controlled fields (sources, contexts,
/// error messages) cannot inject escape sequences or forge extra lines.
class LogObserver final : public IObserver {
public:
  LogObserver();
  explicit LogObserver(std::ostream &out, bool include_metrics = true);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(std::string_view level, const std::string &message);

  std::ostream &out_;
  bool include_metrics_;
  std::mutex mutex_;
};

} // namespace wardline::observability
