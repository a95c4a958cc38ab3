#include "bench_common.hpp"

#include "wardline/guard/error_guard.hpp"
#include "wardline/memory/protection_manager.hpp"

#include <string>

namespace {

wardline::memory::Value wide_object(const int properties) {
  auto value = wardline::memory::Value::object();
  for (int i = 0; i < properties; ++i) {
    value.as_object()->set("key" + std::to_string(i),
                           wardline::memory::Value::string("value " + std::to_string(i)));
  }
  return value;
}

wardline::memory::Value deep_array(const int depth) {
  auto root = wardline::memory::Value::array();
  auto current = root;
  for (int i = 0; i < depth; ++i) {
    auto child = wardline::memory::Value::array();
    current.as_array()->push_back(child);
    current = child;
  }
  return root;
}

} // namespace

void run_memory_benchmark() {
  std::cout << "\n=== Memory Protection Benchmarks ===\n";

  wardline::memory::MemoryConfig config;
  config.log_violations = false;
  wardline::memory::MemoryProtectionManager manager(config);

  const auto object = wide_object(40);
  wardline::bench::run_bench("estimate_object_40", 5000,
                             [&] { (void)manager.validate_object_size(object, "bench"); });

  const auto nested = deep_array(9);
  wardline::bench::run_bench("estimate_nested_9", 5000,
                             [&] { (void)manager.validate_object_size(nested, "bench"); });

  const auto oversized = wardline::memory::Value::string(std::string(20000, 'x'));
  wardline::bench::run_bench("truncate_for_memory", 1000,
                             [&] { (void)manager.truncate_for_memory(oversized); });

  const auto error = wardline::memory::Value::error(std::string(2000, 'e'), "at a\nat b\nat c");
  wardline::bench::run_bench("guard_sanitize_error", 1000, [&] {
    (void)wardline::guard::sanitize_error_with_memory_protection(error, config);
  });
}
