#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

namespace sessionrelay::bench {

/// Keeps a computed value observable so the loop body is not optimised away.
template <typename T> void keep(const T &value) {
  const void *volatile sink = &value;
  (void)sink;
}

inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  fn();
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - start);
  const double per_op_us = static_cast<double>(elapsed.count()) / 1000.0 /
                           static_cast<double>(iterations);
  const double ops_per_sec = per_op_us > 0.0 ? 1'000'000.0 / per_op_us : 0.0;
  std::cout << name << ": iterations=" << iterations << " per_op_us=" << per_op_us
            << " ops_per_sec=" << static_cast<long long>(ops_per_sec) << "\n";
}

} // namespace sessionrelay::bench
