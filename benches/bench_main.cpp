#include <iostream>

void run_sanitize_benchmark();
void run_monitor_benchmark();
void run_memory_benchmark();

int main() {
  std::cout << "Wardline Benchmarks\n";
  run_sanitize_benchmark();
  run_monitor_benchmark();
  run_memory_benchmark();
  return 0;
}
