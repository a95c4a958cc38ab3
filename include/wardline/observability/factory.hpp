#pragma once

#include "wardline/config/schema.hpp"
#include "wardline/observability/observer.hpp"

#include <iosfwd>
#include <memory>

namespace wardline::observability {

/// Builds the observer named by observability.backend: "log", "none"/"noop",
/// or a comma list of those. Unknown names fall back to "log".
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config,
                                                         std::ostream &log_stream);

} // namespace wardline::observability
