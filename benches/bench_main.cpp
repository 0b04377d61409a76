#include <iostream>

void run_config_benchmark();
void run_relay_benchmarks();
void run_concurrency_benchmark();

int main() {
  std::cout << "Session Relay Benchmarks\n";
  run_config_benchmark();
  run_relay_benchmarks();
  run_concurrency_benchmark();
  return 0;
}
