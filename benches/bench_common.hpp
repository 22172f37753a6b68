#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string_view>

namespace paramvault::bench {

struct BenchStats {
  int iterations = 0;
  double min_us = 0.0;
  double avg_us = 0.0;
};

// Times each iteration separately so slow outliers (first KDF call, page cache) show up.
inline BenchStats run_bench(const std::string_view name, const int iterations,
                            const std::function<void()> &fn) {
  using clock = std::chrono::steady_clock;

  BenchStats stats;
  stats.iterations = std::max(iterations, 1);
  double total_us = 0.0;
  for (int i = 0; i < stats.iterations; ++i) {
    const auto begin = clock::now();
    fn();
    const std::chrono::duration<double, std::micro> elapsed = clock::now() - begin;
    total_us += elapsed.count();
    stats.min_us = i == 0 ? elapsed.count() : std::min(stats.min_us, elapsed.count());
  }
  stats.avg_us = total_us / stats.iterations;

  const double ops_per_sec = stats.avg_us > 0.0 ? 1e6 / stats.avg_us : 0.0;
  std::cout << std::left << std::setw(20) << name << std::right << " n=" << std::setw(6)
            << stats.iterations << std::fixed << std::setprecision(1)
            << " min_us=" << std::setw(12) << stats.min_us << " avg_us=" << std::setw(12)
            << stats.avg_us << " ops/s=" << ops_per_sec << "\n";
  std::cout.unsetf(std::ios::fixed);
  return stats;
}

} // namespace paramvault::bench
