#include "wardline/observability/factory.hpp"

#include "wardline/common/fs.hpp"
#include "wardline/observability/log_observer.hpp"
#include "wardline/observability/multi_observer.hpp"
#include "wardline/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>

namespace wardline::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  return create_observer(config, std::cerr);
}

std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                           std::ostream &log_stream) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  const bool include_metrics = config.observability.include_metrics;
  if (backend.empty() || backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend == "log") {
    return std::make_unique<LogObserver>(log_stream, include_metrics);
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::to_lower(common::trim(part));
      if (p == "log") {
        multi->add(std::make_unique<LogObserver>(log_stream, include_metrics));
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return multi;
  }

  return std::make_unique<LogObserver>(log_stream, include_metrics);
}

} // namespace wardline::observability
