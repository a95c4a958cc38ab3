#include "helpers/test_helpers.hpp"

#include "wardline/config/config.hpp"
#include "wardline/observability/global.hpp"

#include <cstdlib>
#include <fstream>
#include <random>

namespace wardline::testing {

config::Config mock_config() {
  config::Config config;
  config.observability.backend = "none";
  config.monitor.alert_threshold = 3;
  config.monitor.time_window_seconds = 10;
  return config;
}

EnvGuard::EnvGuard(std::string key, std::optional<std::string> value) : key_(std::move(key)) {
  if (const char *existing = std::getenv(key_.c_str()); existing != nullptr) {
    old_value_ = existing;
  }
  if (value.has_value()) {
    setenv(key_.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key_.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value_.has_value()) {
    setenv(key_.c_str(), old_value_->c_str(), 1);
  } else {
    unsetenv(key_.c_str());
  }
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("wardline-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TempWorkspace::create_file(const std::string &name,
                                                 const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
  return file_path;
}

ConfigOverrideGuard::~ConfigOverrideGuard() { config::clear_config_path_override(); }

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> CapturingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> CapturingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ScopedCapture::ScopedCapture() {
  auto observer = std::make_unique<CapturingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ScopedCapture::~ScopedCapture() { observability::set_global_observer(nullptr); }

} // namespace wardline::testing
